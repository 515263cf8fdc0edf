/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/test.hpp>
#include "memory.hpp"
#include "update.hpp"

namespace {
    using namespace verdict;

    // Refuses writes to one key to simulate a broken backend
    struct failing_db_t final: storage::memory::db_t {
        std::optional<uint8_vector> poison {};

        void set(const buffer key, const buffer val) override
        {
            if (poison && *poison == uint8_vector { key })
                throw error("the backend refused a write");
            storage::memory::db_t::set(key, val);
        }
    };
}

suite verdict_storage_update_suite = [] {
    "verdict::storage::update"_test = [] {
        const auto k1 = uint8_vector::from_hex("01");
        const auto k2 = uint8_vector::from_hex("02");
        const auto k3 = uint8_vector::from_hex("03");
        "update & commit"_test = [&] {
            auto base = std::make_shared<storage::memory::db_t>();
            base->set(k1, uint8_vector::from_hex("11"));
            base->set(k2, uint8_vector::from_hex("22"));
            storage::update::db_t txn { base };
            txn.set(k3, uint8_vector::from_hex("33"));
            txn.erase(k1);
            txn.set(k2, uint8_vector::from_hex("2222"));
            expect_equal(size_t { 2 }, txn.size());
            expect(!txn.get(k1));
            expect_equal(storage::value_t { uint8_vector::from_hex("2222") }, txn.get(k2));
            // the base is untouched until the commit
            expect_equal(size_t { 2 }, base->size());
            expect_equal(storage::value_t { uint8_vector::from_hex("11") }, base->get(k1));
            std::vector<uint8_vector> keys {};
            txn.foreach([&](const auto &k, const auto &) {
                keys.emplace_back(k);
            });
            expect_equal(size_t { 2 }, keys.size());
            expect_equal(k2, keys.at(0));
            expect_equal(k3, keys.at(1));
            txn.commit();
            expect(txn.updates().empty());
            expect(*base == txn);
            expect(!base->get(k1));
            expect_equal(storage::value_t { uint8_vector::from_hex("33") }, base->get(k3));
        };
        "size accounting"_test = [&] {
            auto base = std::make_shared<storage::memory::db_t>();
            base->set(k1, uint8_vector::from_hex("11"));
            storage::update::db_t txn { base };
            txn.set(k2, uint8_vector::from_hex("22"));
            txn.set(k2, uint8_vector::from_hex("2222"));
            expect_equal(size_t { 2 }, txn.size());
            txn.erase(k2);
            expect_equal(size_t { 1 }, txn.size());
            txn.erase(k1);
            txn.erase(k1);
            expect_equal(size_t { 0 }, txn.size());
            txn.set(k1, uint8_vector::from_hex("11"));
            expect_equal(size_t { 1 }, txn.size());
            // writing back the base value leaves nothing to commit
            expect(txn.updates().empty());
        };
        "drop without commit"_test = [&] {
            auto base = std::make_shared<storage::memory::db_t>();
            {
                storage::update::db_t txn { base };
                txn.set(k1, uint8_vector::from_hex("11"));
            }
            expect(base->empty());
        };
        "failed commit is reverted"_test = [&] {
            auto base = std::make_shared<failing_db_t>();
            base->set(k1, uint8_vector::from_hex("11"));
            base->poison = k2;
            storage::update::db_t txn { base };
            txn.set(k1, uint8_vector::from_hex("1111"));
            txn.set(k2, uint8_vector::from_hex("22"));
            expect(throws([&] { txn.commit(); }));
            expect_equal(size_t { 1 }, base->size());
            expect_equal(storage::value_t { uint8_vector::from_hex("11") }, base->get(k1));
            expect(!base->get(k2));
        };
        "null base"_test = [] {
            expect(throws([] { storage::update::db_t txn { nullptr }; }));
        };
    };
};
