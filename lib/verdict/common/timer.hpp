#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <string>
#include "logger.hpp"

namespace verdict {
    // Logs the wall-clock duration of its scope on destruction
    struct timer {
        explicit timer(std::string title, const logger::level lev=logger::level::debug):
            _title { std::move(title) }, _level { lev }
        {
        }

        ~timer()
        {
            logger::log(_level, "timer {} took {:0.3f} sec", _title, duration());
        }

        timer(const timer &) =delete;
        timer &operator=(const timer &) =delete;

        [[nodiscard]] double duration() const
        {
            return std::chrono::duration<double> { std::chrono::steady_clock::now() - _start }.count();
        }
    private:
        std::string _title;
        logger::level _level;
        std::chrono::steady_clock::time_point _start = std::chrono::steady_clock::now();
    };
}
