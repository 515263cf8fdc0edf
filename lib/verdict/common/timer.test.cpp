/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <thread>
#include "test.hpp"
#include "timer.hpp"

namespace {
    using namespace verdict;
}

suite verdict_common_timer_suite = [] {
    "verdict::common::timer"_test = [] {
        const timer t { "timer test" };
        std::this_thread::sleep_for(std::chrono::milliseconds { 20 });
        const auto d1 = t.duration();
        expect(d1 >= 0.02) << d1;
        expect(t.duration() >= d1);
    };
};
