/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/test.hpp>
#include "memory.hpp"

namespace {
    using namespace verdict;
}

suite verdict_storage_memory_suite = [] {
    "verdict::storage::memory"_test = [] {
        storage::memory::db_t db {};
        expect(db.empty());
        const auto k1 = uint8_vector::from_hex("0102");
        const auto k2 = uint8_vector::from_hex("01");
        db.set(k1, uint8_vector::from_hex("AA"));
        db.set(k2, uint8_vector::from_hex("BB"));
        expect_equal(size_t { 2 }, db.size());
        expect_equal(storage::value_t { uint8_vector::from_hex("AA") }, db.get(k1));
        expect(!db.get(uint8_vector::from_hex("03")));
        db.set(k1, uint8_vector::from_hex("CC"));
        expect_equal(size_t { 2 }, db.size());
        std::vector<uint8_vector> keys {};
        db.foreach([&](const auto &k, const auto &) {
            keys.emplace_back(k);
        });
        expect_equal(size_t { 2 }, keys.size());
        // keys are visited in lexicographic order
        expect_equal(k2, keys.at(0));
        expect_equal(k1, keys.at(1));
        db.erase(k2);
        expect(!db.get(k2));
        expect_equal(size_t { 1 }, db.size());
        db.clear();
        expect(db.empty());
    };
};
