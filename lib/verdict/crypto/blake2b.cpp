/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "blake2b.hpp"
#include "sodium.hpp"

namespace verdict::crypto::blake2b {
    void digest(const hash_span_t &out, const buffer &in)
    {
        sodium::ensure_initialized();
        if (sodium::crypto_generichash(out.data(), out.size(), in.data(), in.size(), nullptr, 0) != 0)
            throw error("libsodium error: can't compute hash!");
    }

    struct hasher::impl {
        sodium::crypto_generichash_state state {};
        bool finished = false;
    };

    hasher::hasher():
        _impl { std::make_unique<impl>() }
    {
        sodium::ensure_initialized();
        if (sodium::crypto_generichash_init(&_impl->state, nullptr, 0, sizeof(hash_t)) != 0)
            throw error("libsodium error: can't initialize a hash state!");
    }

    hasher::~hasher() =default;

    hasher &hasher::update(const buffer &in)
    {
        if (_impl->finished) [[unlikely]]
            throw error("blake2b::hasher: update after finish!");
        if (sodium::crypto_generichash_update(&_impl->state, in.data(), in.size()) != 0)
            throw error("libsodium error: can't update a hash state!");
        return *this;
    }

    void hasher::finish(const hash_span_t &out)
    {
        if (_impl->finished) [[unlikely]]
            throw error("blake2b::hasher: finish called twice!");
        if (sodium::crypto_generichash_final(&_impl->state, out.data(), out.size()) != 0)
            throw error("libsodium error: can't finalize a hash state!");
        _impl->finished = true;
    }
}
