/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/test.hpp>
#include "errors.hpp"

namespace {
    using namespace verdict;
    using namespace verdict::court;
}

suite verdict_court_errors_suite = [] {
    "verdict::court::errors"_test = [] {
        "names"_test = [] {
            expect_equal(std::string_view { "err_not_juror_t" }, std::string_view { err_not_juror_t {}.what() });
            expect_equal(std::string_view { "err_nullifier_already_used_t" }, court_error_t { err_nullifier_already_used_t {} }.name());
        };
        "catch_into"_test = [] {
            std::optional<court_error_t> caught {};
            court_error_t::catch_into(
                [] { throw err_already_voted_t {}; },
                [&](court_error_t err) { caught.emplace(std::move(err)); }
            );
            expect(caught.has_value());
            if (caught) {
                expect(std::holds_alternative<err_already_voted_t>(*caught));
                expect_equal(std::string_view { "err_already_voted_t" }, caught->name());
            }
        };
        "untyped errors pass through"_test = [] {
            expect(throws<error>([] {
                court_error_t::catch_into(
                    [] { throw error("storage failure"); },
                    [](court_error_t) {}
                );
            }));
        };
        "typed errors are verdict errors"_test = [] {
            expect(throws<error>([] { throw err_invalid_threshold_t {}; }));
        };
    };
};
