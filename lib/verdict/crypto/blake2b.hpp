#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <initializer_list>
#include <memory>
#include <verdict/common/bytes.hpp>

namespace verdict::crypto::blake2b
{
    using hash_t = byte_array<32>;
    using hash_span_t = std::span<uint8_t, sizeof(hash_t)>;

    extern void digest(const hash_span_t &out, const buffer &in);

    template<typename T=hash_t>
    T digest(const buffer &in)
    {
        static_assert(sizeof(T) == sizeof(hash_t));
        T out;
        digest(hash_span_t { out.data(), out.size() }, in);
        return out;
    }

    // Incremental hashing of a message given in several parts.
    struct hasher {
        hasher();
        ~hasher();
        hasher(const hasher &) =delete;
        hasher &operator=(const hasher &) =delete;

        hasher &update(const buffer &in);
        void finish(const hash_span_t &out);
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };

    template<typename T=hash_t>
    T digest(const std::initializer_list<buffer> parts)
    {
        static_assert(sizeof(T) == sizeof(hash_t));
        hasher h {};
        for (const auto &p: parts)
            h.update(p);
        T out;
        h.finish(hash_span_t { out.data(), out.size() });
        return out;
    }
}
