/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdio>
#include <cstdlib>
#include <memory>
#include "file.hpp"

namespace verdict::file {
    namespace {
        struct file_closer {
            void operator()(FILE *f) const noexcept
            {
                fclose(f);
            }
        };
        using file_ptr = std::unique_ptr<FILE, file_closer>;
    }

    std::string install_path(const std::string_view rel_path)
    {
        if (const char *env_dir = std::getenv("VERDICT_INSTALL_DIR"); env_dir != nullptr)
            return (std::filesystem::path { env_dir } / rel_path).string();
        return fmt::format("./{}", rel_path);
    }

    uint8_vector read(const std::string &path)
    {
        std::error_code ec {};
        const auto sz = std::filesystem::file_size(path, ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("can't determine the size of {}: {}", path, ec.message()));
        file_ptr f { fopen(path.c_str(), "rb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for reading", path));
        uint8_vector buf(sz);
        if (sz > 0 && fread(buf.data(), 1, buf.size(), f.get()) != buf.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
        return buf;
    }

    void write(const std::string &path, const buffer data)
    {
        file_ptr f { fopen(path.c_str(), "wb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for writing", path));
        if (!data.empty() && fwrite(data.data(), 1, data.size(), f.get()) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }

    std::vector<std::string> files_with_ext(const std::string_view dir, const std::string_view ext)
    {
        std::vector<std::string> res {};
        for (const auto &entry: std::filesystem::recursive_directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension().string() == ext)
                res.emplace_back(entry.path().string());
        }
        std::sort(res.begin(), res.end());
        return res;
    }

    tmp::tmp(const std::string_view name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
    }
}
