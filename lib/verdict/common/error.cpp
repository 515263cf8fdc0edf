/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include <cstring>
#include <typeinfo>
#include "error.hpp"
#include "format.hpp"

namespace verdict {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
    }

    const char *base_error::what() const noexcept
    {
        return _msg.c_str();
    }

    error::error(const std::string_view msg)
        : base_error { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &ex)
        : error { fmt::format("{} caused by {}: {}", msg, typeid(ex).name(), ex.what()) }
    {
    }

    error_sys::error_sys(const std::string_view msg)
        : error { fmt::format("{} errno: {} strerror: {}", msg, errno, std::strerror(errno)) }
    {
    }
}
