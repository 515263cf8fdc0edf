/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <sys/resource.h>
#include <iostream>
#include <verdict/common/test.hpp>
#include <verdict/common/timer.hpp>

int main(const int argc, const char **argv)
{
    using namespace verdict;
    const timer t { "run-test", logger::level::info };
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    {
        static constexpr size_t stack_size = 32ULL << 20U;
        struct rlimit rl;
        if (getrlimit(RLIMIT_STACK, &rl) != 0) [[unlikely]]
            throw error_sys("getrlimit RLIMIT_STACK failed!");
        if (rl.rlim_cur < stack_size) {
            rl.rlim_cur = stack_size;
            if (setrlimit(RLIMIT_STACK, &rl) != 0) [[unlikely]]
                throw error_sys("setrlimit RLIMIT_STACK failed!");
        }
        std::cerr << fmt::format("stack size: {} MB\n", rl.rlim_cur >> 20);
    }
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    return res ? 1 : 0;
}
