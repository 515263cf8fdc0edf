#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stdexcept>
#include <string>
#include <string_view>

namespace verdict {
    struct base_error: std::exception {
        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}
