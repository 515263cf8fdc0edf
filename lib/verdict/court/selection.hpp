#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include <string_view>
#include <vector>
#include "errors.hpp"
#include "types.hpp"

namespace verdict::court::selection {
    using indices_t = std::vector<size_t>;

    // Derives the positions of the selected jurors in the validator list from a seed.
    // Implementations must be deterministic in (seed, pool_size, count).
    struct strategy_t {
        virtual ~strategy_t() = default;
        [[nodiscard]] virtual std::string_view name() const = 0;
        [[nodiscard]] virtual indices_t select(const seed_t &seed, size_t pool_size, size_t count) const = 0;
    };
    using strategy_ptr_t = std::shared_ptr<const strategy_t>;

    // Reads the i-th little-endian 32-bit window of the entropy pool.
    // Every time the eight windows of the pool are used up the pool is replaced by its BLAKE2b hash.
    struct entropy_stream_t {
        explicit entropy_stream_t(const seed_t &seed);
        uint32_t next();
    private:
        seed_t _pool;
        size_t _pos = 0;
    };

    // Draws indices modulo the pool size and rejects repeats.
    // Gives up with err_juror_selection_failed_t after max_attempts draws.
    struct rejection_sampling_t final: strategy_t {
        explicit rejection_sampling_t(size_t max_attempts=config_base::max_selection_attempts);
        [[nodiscard]] std::string_view name() const override;
        [[nodiscard]] indices_t select(const seed_t &seed, size_t pool_size, size_t count) const override;
    private:
        size_t _max_attempts;
    };

    // Legacy: one 4-byte window of the seed per juror with no duplicate check.
    struct windowed_modulo_t final: strategy_t {
        [[nodiscard]] std::string_view name() const override;
        [[nodiscard]] indices_t select(const seed_t &seed, size_t pool_size, size_t count) const override;
    };

    // Fisher-Yates shuffle of the whole pool driven by BLAKE2b(seed || segment), keeps the first count items.
    struct shuffle_t final: strategy_t {
        [[nodiscard]] std::string_view name() const override;
        [[nodiscard]] indices_t select(const seed_t &seed, size_t pool_size, size_t count) const override;
    };

    extern uint32_t uint32_from_entropy(const seed_t &entropy, uint32_t i);
    extern strategy_ptr_t make_strategy(std::string_view name);
}
