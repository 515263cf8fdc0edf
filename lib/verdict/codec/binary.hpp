#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <limits>
#include <verdict/common/bytes.hpp>
#include <verdict/common/numeric-cast.hpp>
#include "serializable.hpp"

namespace verdict::codec::binary {
    struct encoder: archive_t {
        static void uint_fixed(const std::span<uint8_t> &bytes, const size_t num_bytes, const uint64_t val)
        {
            if (!num_bytes) [[unlikely]]
                throw error("binary::encoder: uint_fixed: num_bytes must be greater than 0!");
            if (bytes.size() != num_bytes) [[unlikely]]
                throw error(fmt::format("uint_fixed: expected an output buffer of {} bytes, got {}", num_bytes, bytes.size()));
            auto x = val;
            for (size_t i = 0; i < num_bytes; ++i) {
                bytes[i] = static_cast<uint8_t>(x & 0xFF);
                x >>= 8;
            }
            if (x) [[unlikely]]
                throw error(fmt::format("{} cannot be encoded as a sequence of {} bytes", val, num_bytes));
        }

        template<typename ...Args>
        explicit encoder(const Args &... args)
        {
            (encode(args), ...);
        }

        void uint_fixed(const size_t num_bytes, const uint64_t val)
        {
            _bytes.resize(_bytes.size() + num_bytes);
            // resize can reallocate, so take the pointer only after that
            uint_fixed(std::span { _bytes.data() + _bytes.size() - num_bytes, num_bytes }, num_bytes, val);
        }

        // 1-9 byte length encoding: the number of leading one bits of the first byte gives the number of extra bytes
        void uint_varlen(const uint64_t x)
        {
            static constexpr uint64_t max_uint_val = uint64_t { 1 } << 56;
            if (x >= max_uint_val) [[unlikely]] {
                _bytes.emplace_back(0xFF);
                uint_fixed(8, x);
                return;
            }
            size_t l = 0;
            while (x >= uint64_t { 1 } << (7 * (l + 1))) {
                ++l;
            }
            const auto base = l << 3;
            const auto bit_mask = static_cast<uint8_t>(0x100 - (1U << (8 - l)));
            const auto high_bits = static_cast<uint8_t>(x >> base);
            _bytes.emplace_back(bit_mask | high_bits);
            if (l > 0)
                uint_fixed(l, x & ((uint64_t { 1 } << base) - 1));
        }

        void process_array(const auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            if (!(static_cast<int>(self.size() >= min_sz) & static_cast<int>(self.size() <= max_sz))) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", self.size(), min_sz, max_sz));
            uint_varlen(self.size());
            for (const auto &v: self)
                encode(v);
        }

        void process_bytes(const buffer bytes, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            if (bytes.size() > max_sz) [[unlikely]]
                throw error(fmt::format("a byte string of {} bytes exceeds the limit of {} bytes", bytes.size(), max_sz));
            uint_varlen(bytes.size());
            _bytes << bytes;
        }

        void process_bytes_fixed(const buffer bytes)
        {
            _bytes << bytes;
        }

        void process_optional(const auto &val)
        {
            if (val.has_value()) {
                uint_fixed(1, 1);
                encode(*val);
            } else {
                uint_fixed(1, 0);
            }
        }

        template<typename T>
        void encode(const T &val)
        {
            if constexpr (serializable_c<T>) {
                // the encoder methods do not update the value, so it's safe to const_cast it
                const_cast<T &>(val).serialize(*this);
            } else if constexpr (enum_c<T>) {
                uint_fixed(1, static_cast<uint8_t>(val));
            } else if constexpr (std::is_same_v<T, bool>) {
                uint_fixed(1, static_cast<uint8_t>(val));
            } else if constexpr (std::is_same_v<T, int64_t>) {
                uint_fixed(8, static_cast<uint64_t>(val));
            } else if constexpr (std::is_unsigned_v<T>) {
                uint_fixed(sizeof(T), val);
            } else {
                throw error(fmt::format("binary serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view, const T &val)
        {
            encode(val);
        }

        uint8_vector &bytes()
        {
            return _bytes;
        }

        const uint8_vector &bytes() const
        {
            return _bytes;
        }
    private:
        uint8_vector _bytes {};
    };

    struct decoder: archive_t {
        explicit decoder(const buffer bytes) noexcept:
            _ptr { bytes.data() },
            _end { bytes.data() + bytes.size() }
        {
        }

        template<typename T>
        T uint_fixed(const size_t num_bytes)
        {
            if (num_bytes > 8) [[unlikely]]
                throw error("uint_fixed supports 8-bytes values at most!");
            uint64_t x = 0;
            for (size_t i = 0; i < num_bytes; ++i) {
                x |= static_cast<uint64_t>(next()) << (i * 8);
            }
            return numeric_cast<T>(x);
        }

        template<typename T=uint64_t>
        T uint_varlen()
        {
            auto prefix = uint_fixed<uint8_t>(1);
            if (prefix == 0xFF)
                return numeric_cast<T>(uint_fixed<uint64_t>(8));
            size_t l = 0;
            while (prefix & (1U << (7 - l))) {
                prefix &= ~(1U << (7 - l));
                ++l;
            }
            uint64_t res = static_cast<uint64_t>(prefix) << (l << 3);
            if (l > 0)
                res |= uint_fixed<uint64_t>(l);
            return numeric_cast<T>(res);
        }

        template<typename T>
        void decode(T &val)
        {
            if constexpr (serializable_c<T>) {
                val.serialize(*this);
            } else if constexpr (enum_c<T>) {
                val = enum_from_index<T>(uint_fixed<uint8_t>(1));
            } else if constexpr (std::is_same_v<T, bool>) {
                const auto b = uint_fixed<uint8_t>(1);
                if (b > 1) [[unlikely]]
                    throw error(fmt::format("invalid boolean value: {}", b));
                val = b != 0;
            } else if constexpr (std::is_same_v<T, int64_t>) {
                val = static_cast<int64_t>(uint_fixed<uint64_t>(8));
            } else if constexpr (std::is_unsigned_v<T>) {
                val = uint_fixed<T>(sizeof(T));
            } else {
                throw error(fmt::format("binary serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view, T &val)
        {
            decode(val);
        }

        void process_optional(auto &val)
        {
            val.reset();
            switch (const auto typ = uint_fixed<uint8_t>(1)) {
                case 0: break;
                case 1:
                    val.emplace();
                    decode(*val);
                    break;
                [[unlikely]] default: throw error(fmt::format("unsupported optional type: {}", typ));
            }
        }

        void process_array(auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            using T = std::decay_t<decltype(self)>;
            const auto sz = uint_varlen<size_t>();
            if (!(static_cast<int>(sz >= min_sz) & static_cast<int>(sz <= max_sz))) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", sz, min_sz, max_sz));
            self.clear();
            self.reserve(sz);
            for (size_t i = 0; i < sz; ++i) {
                typename T::value_type v;
                decode(v);
                if constexpr (has_emplace_c<T>) {
                    if (!self.emplace(std::move(v)).second) [[unlikely]]
                        throw error(fmt::format("a set of type {} contains non-unique items", typeid(T).name()));
                } else {
                    self.emplace_back(std::move(v));
                }
            }
        }

        void process_bytes(std::vector<uint8_t> &bytes, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            const auto sz = uint_varlen<size_t>();
            if (sz > max_sz) [[unlikely]]
                throw error(fmt::format("a byte string of {} bytes exceeds the limit of {} bytes", sz, max_sz));
            const auto data = next_bytes(sz);
            bytes.assign(data.begin(), data.end());
        }

        void process_bytes_fixed(const std::span<uint8_t> bytes)
        {
            const auto data = next_bytes(bytes.size());
            std::copy(data.begin(), data.end(), bytes.begin());
        }

        [[nodiscard]] uint8_t next()
        {
            if (_ptr >= _end) [[unlikely]]
                throw error("codec: an attempt to read past the end of the byte stream");
            return *_ptr++;
        }

        [[nodiscard]] buffer next_bytes(const size_t sz)
        {
            if (sz > size()) [[unlikely]]
                throw error("codec: an attempt to read past the end of the byte stream");
            const auto *begin = _ptr;
            _ptr += sz;
            return { begin, sz };
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return _ptr >= _end;
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return empty() ? size_t { 0 } : static_cast<size_t>(_end - _ptr);
        }
    private:
        const uint8_t *_ptr, *_end;
    };

    template<typename T>
    uint8_vector encode(const T &val)
    {
        encoder enc { val };
        return std::move(enc.bytes());
    }

    template<typename T>
    T decode(const buffer bytes)
    {
        decoder dec { bytes };
        T res;
        dec.decode(res);
        if (!dec.empty()) [[unlikely]]
            throw error(fmt::format("{} trailing bytes after a value of type {}", dec.size(), typeid(T).name()));
        return res;
    }
}
