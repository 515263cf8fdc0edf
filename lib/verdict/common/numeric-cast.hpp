#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <typeinfo>
#include <utility>
#include "error.hpp"
#include "format.hpp"

namespace verdict {
    template<typename TO, typename FROM>
    constexpr TO numeric_cast(const FROM from)
    {
        static_assert(std::numeric_limits<FROM>::is_integer && std::numeric_limits<TO>::is_integer);
        if constexpr (std::numeric_limits<FROM>::is_signed) {
            if (from < 0 && !std::numeric_limits<TO>::is_signed) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is negative", typeid(FROM).name(), from, typeid(TO).name()));
        }
        if (std::cmp_greater(from, std::numeric_limits<TO>::max())) [[unlikely]]
            throw error(fmt::format("can't convert {} {} to {}: the value is larger than {}",
                typeid(FROM).name(), from, typeid(TO).name(), std::numeric_limits<TO>::max()));
        if (std::cmp_less(from, std::numeric_limits<TO>::min())) [[unlikely]]
            throw error(fmt::format("can't convert {} {} to {}: the value is too small", typeid(FROM).name(), from, typeid(TO).name()));
        return static_cast<TO>(from);
    }
}
