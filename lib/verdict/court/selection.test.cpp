/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <numeric>
#include <tuple>
#include <verdict/common/test.hpp>
#include <verdict/crypto/blake2b.hpp>
#include "selection.hpp"

namespace {
    using namespace verdict;
    using namespace verdict::court;
    using namespace verdict::court::selection;

    bool distinct_in_range(indices_t indices, const size_t pool_size)
    {
        std::sort(indices.begin(), indices.end());
        return std::adjacent_find(indices.begin(), indices.end()) == indices.end()
            && (indices.empty() || indices.back() < pool_size);
    }
}

suite verdict_court_selection_suite = [] {
    "verdict::court::selection"_test = [] {
        const auto seed = seed_t::from_hex<seed_t>("0000000002000000040000000000000000000000000000000000000000000000");
        // every window of the seed holds 1
        const auto flat_seed = seed_t::from_hex<seed_t>("0100000001000000010000000100000001000000010000000100000001000000");
        const auto random_seed = seed_t::from_hex<seed_t>("9f3c1e07d2a4b6584e1f0c3a7b9d2e6f11223344556677889900aabbccddeeff");
        "entropy_stream"_test = [&] {
            entropy_stream_t stream { seed };
            expect_equal(uint32_t { 0 }, stream.next());
            expect_equal(uint32_t { 2 }, stream.next());
            expect_equal(uint32_t { 4 }, stream.next());
            for (size_t i = 3; i < 8; ++i)
                expect_equal(uint32_t { 0 }, stream.next());
            // the ninth window comes from the rehashed pool
            const auto rehashed = crypto::blake2b::digest<seed_t>(seed);
            entropy_stream_t next_stream { rehashed };
            expect_equal(next_stream.next(), stream.next());
        };
        "rejection sampling"_test = [&] {
            const rejection_sampling_t strategy {};
            expect(strategy.select(seed, 5, 3) == indices_t { 0, 2, 4 });
            const auto big = strategy.select(random_seed, 100, 20);
            expect_equal(size_t { 20 }, big.size());
            expect(distinct_in_range(big, 100));
            expect(big == strategy.select(random_seed, 100, 20));
            expect(big != strategy.select(seed, 100, 20));
            // repeated draws are skipped and the pool is rehashed when exhausted
            const auto from_flat = strategy.select(flat_seed, 5, 3);
            expect_equal(size_t { 1 }, from_flat.at(0));
            expect(distinct_in_range(from_flat, 5));
            // the whole pool can be drawn
            const auto all = strategy.select(random_seed, 20, 20);
            expect(distinct_in_range(all, 20));
        };
        "rejection sampling gives up"_test = [&] {
            const rejection_sampling_t strategy { 5 };
            expect(throws<err_juror_selection_failed_t>([&] { std::ignore = strategy.select(flat_seed, 5, 3); }));
            expect(throws<err_not_enough_validators_t>([&] { std::ignore = strategy.select(seed, 2, 3); }));
        };
        "windowed modulo"_test = [&] {
            const windowed_modulo_t strategy {};
            expect(strategy.select(seed, 5, 3) == indices_t { 0, 2, 4 });
            // no duplicate check
            expect(strategy.select(flat_seed, 5, 3) == indices_t { 1, 1, 1 });
        };
        "shuffle"_test = [&] {
            const shuffle_t strategy {};
            const auto full = strategy.select(random_seed, 10, 10);
            auto sorted = full;
            std::sort(sorted.begin(), sorted.end());
            indices_t exp(10);
            std::iota(exp.begin(), exp.end(), size_t { 0 });
            expect(sorted == exp);
            const auto prefix = strategy.select(random_seed, 10, 3);
            expect(std::equal(prefix.begin(), prefix.end(), full.begin()));
            expect(strategy.select(seed, 0, 0).empty());
        };
        "make_strategy"_test = [] {
            expect_equal(std::string_view { "rejection_sampling" }, make_strategy("rejection_sampling")->name());
            expect_equal(std::string_view { "windowed_modulo" }, make_strategy("windowed_modulo")->name());
            expect_equal(std::string_view { "shuffle" }, make_strategy("shuffle")->name());
            expect(throws([] { make_strategy("coin_flip"); }));
        };
    };
};
