/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/test.hpp>
#include "randomness.hpp"

namespace {
    using namespace verdict;
    using namespace verdict::court;
}

suite verdict_court_randomness_suite = [] {
    "verdict::court::randomness"_test = [] {
        const auto header = uint8_vector::from_hex("0102030405060708");
        const auto seed = seed_t::from_hex<seed_t>("0000000002000000040000000000000000000000000000000000000000000000");
        "extract_seed"_test = [&] {
            uint8_vector data = header;
            data << seed;
            expect_equal(seed, randomness::extract_seed(data));
            // trailing bytes after the entropy are ignored
            data << uint8_vector::from_hex("FFFF");
            expect_equal(seed, randomness::extract_seed(data));
        };
        "not ready"_test = [&] {
            expect(throws<err_vrf_not_ready_t>([&] { randomness::extract_seed(header); }));
            uint8_vector short_data = header;
            short_data << static_cast<buffer>(seed).subbuf(0, 31);
            expect(throws<err_vrf_not_ready_t>([&] { randomness::extract_seed(short_data); }));
            uint8_vector zero_data = header;
            zero_data << seed_t {};
            expect(throws<err_vrf_not_ready_t>([&] { randomness::extract_seed(zero_data); }));
        };
        "oracle"_test = [&] {
            address_t account {};
            account.fill(0x77);
            randomness::memory_oracle_t oracle {};
            expect(throws<err_vrf_not_ready_t>([&] { randomness::extract_seed(oracle, account); }));
            uint8_vector data = header;
            data << seed;
            oracle.post(account, data);
            expect_equal(seed, randomness::extract_seed(oracle, account));
            oracle.erase(account);
            expect(!oracle.account_data(account));
        };
    };
};
