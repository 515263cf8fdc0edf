/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/test.hpp>
#include "blake2b.hpp"

namespace {
    using namespace verdict;
    using namespace crypto::blake2b;
}

suite verdict_crypto_blake2b_suite = [] {
    "verdict::crypto::blake2b"_test = [] {
        "test vectors"_test = [] {
            using test_vector = std::pair<std::string_view, uint8_vector>;
            static std::vector test_vectors = {
                test_vector { "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8", uint8_vector {} },
                test_vector { "EF72A2CDE2A485B61F25762073155CC857A3D1B3FFD07B9C9B1993C75E07879D", uint8_vector::from_hex("000102030405060708090A0B0C0E0F") }
            };
            for (const auto &[exp_hex, input]: test_vectors) {
                const auto exp = hash_t::from_hex(exp_hex);
                expect_equal(exp, digest(input));
            }
        };
        "parts"_test = [] {
            const auto whole = uint8_vector::from_hex("000102030405060708090A0B0C0E0F");
            const buffer b = whole;
            expect_equal(digest(whole), digest({ b.subbuf(0, 4), b.subbuf(4, 7), b.subbuf(11) }));
            hasher h {};
            h.update(b.subbuf(0, 8)).update(b.subbuf(8));
            hash_t out {};
            h.finish(hash_span_t { out.data(), out.size() });
            expect_equal(digest(whole), out);
        };
    };
};
