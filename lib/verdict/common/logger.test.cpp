/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "logger.hpp"

using namespace verdict;

suite verdict_common_logger_suite = [] {
    using boost::ut::nothrow;
    "verdict::common::logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - {} {}", "debug", 2);
            logger::info("OK - info");
            logger::warn("OK - {}", "warn");
            logger::error("OK - {}", "error");
            expect(true);
        };
        "run_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] {});
            expect(!ex1);
            const auto ex2 = logger::run_log_errors([] { throw error("a juror is missing"); });
            expect(static_cast<bool>(ex2));
        };
        "cleanup runs on both paths"_test = [] {
            size_t cleanups = 0;
            logger::run_log_errors([] {}, [&] { ++cleanups; });
            logger::run_log_errors([] { throw error("boom"); }, [&] { ++cleanups; });
            expect_equal(size_t { 2 }, cleanups);
        };
        "run_log_errors_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] {}); }));
            expect(throws<error>([] { logger::run_log_errors_rethrow([] { throw error("boom"); }); }));
        };
    };
};
