/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif

#include "file.hpp"
#include "logger.hpp"

namespace verdict::logger {
    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("VERDICT_DEBUG") != nullptr;
        return enabled;
    }

    static std::string log_path()
    {
        const char *env_log_path = std::getenv("VERDICT_LOG");
        return file::install_path(env_log_path ? env_log_path : "log/verdict.log");
    }

    static bool console_enabled()
    {
        return !std::getenv("VERDICT_LOG_NO_CONSOLE");
    }

    static spdlog::logger create(const std::string &path)
    {
        {
            const auto dir = std::filesystem::path { path }.parent_path();
            std::error_code ec {};
            if (!dir.empty())
                std::filesystem::create_directories(dir, ec);
            std::ofstream os { path, std::ios_base::app };
            if (!os) {
                std::cerr << fmt::format("INIT: Unable to write to the log file: {}; terminating.\n", path);
                std::terminate();
            }
        }

        std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink {};
        if (console_enabled()) {
            console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
        auto logger = console_sink
            ? spdlog::logger("verdict", { file_sink, console_sink })
            : spdlog::logger("verdict", { file_sink });
        logger.set_level(tracing_enabled() ? spdlog::level::trace : spdlog::level::debug);
        logger.flush_on(spdlog::level::debug);
        logger.log(spdlog::level::debug, fmt::format("log path: {}", path));
        return logger;
    }

    spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }
}
