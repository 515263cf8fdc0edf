/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "errors.hpp"

namespace verdict::court {
    std::string_view court_error_t::name() const
    {
        return std::visit([](const auto &err) {
            return std::string_view { err.what() };
        }, static_cast<const court_error_variant_t &>(*this));
    }
}
