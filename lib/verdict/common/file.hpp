#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "bytes.hpp"

namespace verdict::file {
    extern std::string install_path(std::string_view rel_path);
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);
    extern std::vector<std::string> files_with_ext(std::string_view dir, std::string_view ext);

    // A file in the system temporary directory that is removed when the object goes out of scope
    struct tmp {
        explicit tmp(std::string_view name);
        ~tmp();

        tmp(const tmp &) =delete;
        tmp &operator=(const tmp &) =delete;

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}
