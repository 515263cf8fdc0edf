#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#ifndef FMT_HEADER_ONLY
#   include <fmt/core.h>
#endif
#include <fmt/format.h>
#include <optional>
#include <string_view>

namespace verdict {
    template<typename... Args>
    std::string format(const fmt::format_string<Args...> fmt, Args &&...a)
    {
        return fmt::format(fmt, std::forward<Args>(a)...);
    }
}

namespace fmt {
    template<typename T>
    struct formatter<std::optional<T>>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const std::optional<T> &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "std::nullopt");
        }
    };
}
