/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "bytes.hpp"

namespace verdict {
    std::string to_hex(const buffer bytes)
    {
        static constexpr std::string_view digits { "0123456789abcdef" };
        std::string res {};
        res.reserve(bytes.size() * 2);
        for (const auto b: bytes) {
            res.push_back(digits[b >> 4]);
            res.push_back(digits[b & 0xF]);
        }
        return res;
    }
}
