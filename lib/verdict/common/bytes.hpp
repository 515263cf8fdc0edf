#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <array>
#include <cctype>
#include <compare>
#include <cstring>
#include <span>
#include <string>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace verdict {
    struct buffer: std::span<const uint8_t> {
        buffer() =default;
        buffer(const buffer &) =default;

        template <typename T, size_t SZ>
        buffer(const std::span<T, SZ> bytes):
            buffer { reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size() * sizeof(T) }
        {
        }

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer &operator=(const buffer &o) =default;

        template<typename M>
        static constexpr buffer from(const M &val)
        {
            return buffer { reinterpret_cast<const uint8_t *>(&val), sizeof(val) };
        }

        operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            const auto min_sz = std::min(size(), o.size());
            const auto cmp = min_sz ? memcmp(data(), o.data(), min_sz) : 0;
            if (cmp < 0)
                return std::strong_ordering::less;
            if (cmp > 0)
                return std::strong_ordering::greater;
            return size() <=> o.size();
        }

        bool operator==(const buffer &o) const noexcept
        {
            return std::strong_ordering::equal == (*this <=> o);
        }

        buffer subbuf(const size_t offset, const size_t sz) const
        {
            if (offset + sz <= size()) [[likely]]
                return buffer { data() + offset, sz };
            throw error(fmt::format("requested offset: {} and size: {} end over the end of buffer's size: {}!", offset, sz, size()));
        }

        buffer subbuf(const size_t offset) const
        {
            if (offset <= size()) [[likely]]
                return subbuf(offset, size() - offset);
            throw error(fmt::format("a buffer's offset {} is greater than its size {}", offset, size()));
        }
    };

    inline uint8_t uint_from_hex(const char k)
    {
        switch (std::tolower(k)) {
            case '0': return 0;
            case '1': return 1;
            case '2': return 2;
            case '3': return 3;
            case '4': return 4;
            case '5': return 5;
            case '6': return 6;
            case '7': return 7;
            case '8': return 8;
            case '9': return 9;
            case 'a': return 10;
            case 'b': return 11;
            case 'c': return 12;
            case 'd': return 13;
            case 'e': return 14;
            case 'f': return 15;
            default: throw error(fmt::format("unexpected character in a hex number: {}!", k));
        }
    }

    // accepts an optional 0x prefix
    inline void init_from_hex(std::span<uint8_t> out, std::string_view hex)
    {
        if (hex.starts_with("0x"))
            hex = hex.substr(2);
        if (hex.size() != out.size() * 2)
            throw error(fmt::format("hex string must have {} characters but got {}: {}!", out.size() * 2, hex.size(), hex));
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = uint_from_hex(hex[i * 2]) << 4 | uint_from_hex(hex[i * 2 + 1]);
    }

    extern std::string to_hex(buffer bytes);

    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        static constexpr size_t static_size = SZ;
        using base_type = std::array<uint8_t, SZ>;

        template<typename C=byte_array<SZ>>
        static C from_hex(const std::string_view hex)
        {
            C data;
            init_from_hex(data, hex);
            return data;
        }

        byte_array(): base_type {}
        {
        }

        byte_array(const std::initializer_list<uint8_t> s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("span must be of size {} but got {}", SZ, s.size()));
            std::copy(s.begin(), s.end(), base_type::begin());
        }

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("a buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), s.data(), SZ);
        }

        byte_array &operator=(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("a buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), s.data(), SZ);
            return *this;
        }

        [[nodiscard]] bool is_zero() const noexcept
        {
            return std::all_of(base_type::begin(), base_type::end(), [](const auto b) { return b == 0; });
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }
    };

    struct uint8_vector: std::vector<uint8_t> {
        using base_type = std::vector<uint8_t>;
        using base_type::base_type;

        template<typename C=uint8_vector>
        static C from_hex(std::string_view hex)
        {
            if (hex.starts_with("0x"))
                hex = hex.substr(2);
            if (hex.size() % 2 != 0)
                throw error(fmt::format("hex string must have an even number of characters but got {}!", hex.size()));
            C data(hex.size() / 2);
            init_from_hex(data, hex);
            return data;
        }

        uint8_vector() noexcept =default;

        uint8_vector(base_type &&o) noexcept:
            base_type { std::move(o) }
        {
        }

        explicit uint8_vector(const size_t sz):
            base_type(sz)
        {
        }

        uint8_vector(const buffer bytes):
            base_type { bytes.begin(), bytes.end() }
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        uint8_vector &operator=(const buffer bytes)
        {
            assign(bytes.begin(), bytes.end());
            return *this;
        }

        std::strong_ordering operator<=>(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) <=> static_cast<buffer>(o);
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return std::strong_ordering::equal == (*this <=> o);
        }
    };

    inline uint8_vector &operator<<(uint8_vector &v, const buffer b)
    {
        v.insert(v.end(), b.begin(), b.end());
        return v;
    }

    template<typename T>
    concept bytes_c = std::is_base_of_v<buffer, T>
        || std::is_base_of_v<uint8_vector, T>
        || requires { { T::static_size } -> std::convertible_to<size_t>; };
}

namespace fmt {
    template<verdict::bytes_c T>
    struct formatter<T>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            const verdict::buffer bytes = v;
            return fmt::format_to(ctx.out(), "0x{}", verdict::to_hex(bytes));
        }
    };
}
