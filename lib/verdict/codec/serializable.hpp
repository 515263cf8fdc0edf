#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <concepts>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <typeinfo>
#include <variant>
#include <verdict/common/bytes.hpp>

namespace verdict::codec {
    struct archive_t {
    };

    template<typename T>
    T from(auto &archive)
    {
        T res;
        res.serialize(archive);
        return res;
    }

    template<typename T>
    using variant_names_t = std::array<std::string_view, std::variant_size_v<T>>;

    template<typename T, size_t I>
    void variant_set_type(T &val, const size_t requested_type, auto &archive)
    {
        if (requested_type >= std::variant_size_v<T>) [[unlikely]]
            throw error(fmt::format("an unsupported type value {} for {}", requested_type, typeid(T).name()));
        if constexpr (I < std::variant_size_v<T>) {
            if (requested_type > I)
                return variant_set_type<T, I + 1>(val, requested_type, archive);
            val = codec::from<std::variant_alternative_t<I, T>>(archive);
        }
    }

    template<typename T>
    concept has_emplace_c = requires(T t)
    {
        { t.emplace() };
    };

    template<typename T>
    concept serializable_c = requires(T t, archive_t a)
    {
        { t.serialize(a) } -> std::same_as<void>;
    };

    // Enumerations are serialized as their index and are named by enum_traits<T>::names.
    template<typename T>
    struct enum_traits;

    template<typename T>
    concept enum_c = std::is_enum_v<T> && requires { { enum_traits<T>::names } -> std::convertible_to<std::span<const std::string_view>>; };

    template<enum_c T>
    T enum_from_index(const uint64_t idx)
    {
        if (idx >= enum_traits<T>::names.size()) [[unlikely]]
            throw error(fmt::format("value {} is out of range for enum {}", idx, typeid(T).name()));
        return static_cast<T>(idx);
    }

    template<enum_c T>
    T enum_from_name(const std::string_view name)
    {
        const auto &names = enum_traits<T>::names;
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name)
                return static_cast<T>(i);
        }
        throw error(fmt::format("unknown value '{}' for enum {}", name, typeid(T).name()));
    }

    template<enum_c T>
    std::string_view enum_name(const T val)
    {
        const auto idx = static_cast<size_t>(val);
        const auto &names = enum_traits<T>::names;
        if (idx >= names.size()) [[unlikely]]
            throw error(fmt::format("value {} is out of range for enum {}", idx, typeid(T).name()));
        return names[idx];
    }

    template<typename T>
    concept optional_c = requires(T t)
    {
        { t.reset() };
        { t.has_value() } -> std::convertible_to<bool>;
    };

    // Single-line human-readable rendering used by logs and test diagnostics.
    template<typename OUT_IT>
    struct formatter: archive_t {
        explicit formatter(OUT_IT it):
            _it { std::move(it) }
        {
        }

        template<typename T>
        void format(const T &val)
        {
            if constexpr (bytes_c<T>) {
                _it = fmt::format_to(_it, "{}", static_cast<buffer>(val));
            } else if constexpr (optional_c<T>) {
                if (val.has_value())
                    format(*val);
                else
                    _it = fmt::format_to(_it, "null");
            } else if constexpr (serializable_c<T> && std::ranges::range<T>) {
                const_cast<T &>(val).serialize(*this);
            } else if constexpr (serializable_c<T>) {
                _it = fmt::format_to(_it, "{{");
                _first = true;
                const_cast<T &>(val).serialize(*this);
                _it = fmt::format_to(_it, "}}");
                _first = false;
            } else if constexpr (enum_c<T>) {
                _it = fmt::format_to(_it, "{}", enum_name(val));
            } else {
                _it = fmt::format_to(_it, "{}", val);
            }
        }

        void process(const std::string_view name, const auto &val)
        {
            _it = fmt::format_to(_it, "{}{}: ", _first ? "" : ", ", name);
            _first = false;
            format(val);
            _first = false;
        }

        void process_array(const auto &arr, const size_t /*min_sz*/=0, const size_t /*max_sz*/=0)
        {
            _it = fmt::format_to(_it, "[");
            bool first = true;
            for (const auto &v: arr) {
                if (!first)
                    _it = fmt::format_to(_it, ", ");
                format(v);
                first = false;
            }
            _it = fmt::format_to(_it, "]");
        }

        void process_optional(const auto &val)
        {
            format(val);
        }

        void process_bytes(const buffer bytes, const size_t /*max_sz*/=0)
        {
            _it = fmt::format_to(_it, "{}", bytes);
        }

        void process_bytes_fixed(const buffer bytes)
        {
            _it = fmt::format_to(_it, "{}", bytes);
        }

        OUT_IT it() const
        {
            return _it;
        }
    private:
        OUT_IT _it;
        bool _first = true;
    };
}

namespace fmt {
    template<verdict::codec::serializable_c T>
    requires (!verdict::bytes_c<T>)
    struct formatter<T>: formatter<int> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            verdict::codec::formatter<decltype(ctx.out())> frmtr { ctx.out() };
            frmtr.format(v);
            return frmtr.it();
        }
    };

    template<verdict::codec::enum_c T>
    struct formatter<T>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", verdict::codec::enum_name(v));
        }
    };
}
