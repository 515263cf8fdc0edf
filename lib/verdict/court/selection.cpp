/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <bit>
#include <numeric>
#include <boost/container/flat_set.hpp>
#include <verdict/crypto/blake2b.hpp>
#include "selection.hpp"

namespace verdict::court::selection {
    namespace {
        uint32_t uint32_at(const buffer bytes, const size_t offset)
        {
            uint32_t res = 0;
            for (size_t j = 0; j < sizeof(res); ++j) {
                res |= static_cast<uint32_t>(bytes[(offset + j) % bytes.size()]) << (j * 8U);
            }
            return res;
        }

        void check_pool(const size_t pool_size, const size_t count)
        {
            if (count > pool_size) [[unlikely]]
                throw err_not_enough_validators_t {};
        }
    }

    entropy_stream_t::entropy_stream_t(const seed_t &seed):
        _pool { seed }
    {
    }

    uint32_t entropy_stream_t::next()
    {
        static constexpr size_t windows = seed_t::static_size / sizeof(uint32_t);
        if (_pos == windows) {
            _pool = crypto::blake2b::digest<seed_t>(_pool);
            _pos = 0;
        }
        return uint32_at(_pool, _pos++ * sizeof(uint32_t));
    }

    rejection_sampling_t::rejection_sampling_t(const size_t max_attempts):
        _max_attempts { max_attempts }
    {
    }

    std::string_view rejection_sampling_t::name() const
    {
        return "rejection_sampling";
    }

    indices_t rejection_sampling_t::select(const seed_t &seed, const size_t pool_size, const size_t count) const
    {
        check_pool(pool_size, count);
        indices_t res {};
        res.reserve(count);
        boost::container::flat_set<size_t> chosen {};
        chosen.reserve(count);
        entropy_stream_t stream { seed };
        for (size_t attempt = 0; res.size() < count; ++attempt) {
            if (attempt >= _max_attempts) [[unlikely]]
                throw err_juror_selection_failed_t {};
            const size_t idx = stream.next() % pool_size;
            if (chosen.emplace(idx).second)
                res.emplace_back(idx);
        }
        return res;
    }

    std::string_view windowed_modulo_t::name() const
    {
        return "windowed_modulo";
    }

    indices_t windowed_modulo_t::select(const seed_t &seed, const size_t pool_size, const size_t count) const
    {
        check_pool(pool_size, count);
        indices_t res {};
        res.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            res.emplace_back(uint32_at(seed, i * sizeof(uint32_t)) % pool_size);
        }
        return res;
    }

    uint32_t uint32_from_entropy(const seed_t &entropy, const uint32_t i)
    {
        static constexpr size_t uint_sz = sizeof(i);
        static constexpr size_t segment_sz = seed_t::static_size / uint_sz;
        const uint32_t seg_idx = i / segment_sz;
        byte_array<uint_sz> seg_bytes {};
        for (size_t j = 0; j < uint_sz; ++j)
            seg_bytes[j] = static_cast<uint8_t>(seg_idx >> (j * 8U));
        const auto entropy_i = crypto::blake2b::digest({ entropy, seg_bytes });
        return uint32_at(entropy_i, (i * uint_sz) % entropy_i.size());
    }

    std::string_view shuffle_t::name() const
    {
        return "shuffle";
    }

    indices_t shuffle_t::select(const seed_t &seed, const size_t pool_size, const size_t count) const
    {
        check_pool(pool_size, count);
        indices_t out(pool_size);
        std::iota(out.begin(), out.end(), size_t { 0 });
        for (size_t i = 0; i < out.size(); ++i) {
            const auto tail_sz = out.size() - i;
            const auto next_idx = uint32_from_entropy(seed, static_cast<uint32_t>(i)) % tail_sz;
            std::swap(out[next_idx], out[tail_sz - 1]);
        }
        std::reverse(out.begin(), out.end());
        out.resize(count);
        return out;
    }

    strategy_ptr_t make_strategy(const std::string_view name)
    {
        if (name == "rejection_sampling")
            return std::make_shared<rejection_sampling_t>();
        if (name == "windowed_modulo")
            return std::make_shared<windowed_modulo_t>();
        if (name == "shuffle")
            return std::make_shared<shuffle_t>();
        throw error(fmt::format("unknown juror selection strategy: {}", name));
    }
}
