#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <vector>
#include <boost/json.hpp>
#include "court.hpp"

namespace verdict::court::scenario {
    // Records every freeze request and optionally refuses them
    struct recording_freeze_t final: freeze_service_t {
        std::vector<freeze_request_t> requests {};
        bool fail = false;

        void freeze(const freeze_request_t &req) override;
    };

    // Returns a preset tally regardless of the submitted partial decryptions
    struct fixed_combiner_t final: combiner_t {
        explicit fixed_combiner_t(const vote_result_t &result);
        [[nodiscard]] vote_result_t combine(const mpc_session_t &session, const aggregation_t &aggregation) const override;
    private:
        vote_result_t _result;
    };

    struct report_t {
        size_t steps = 0;
        size_t expected_errors = 0;
        std::vector<case_t> cases {};
        std::vector<freeze_request_t> freezes {};
    };

    // Runs the steps of a scenario against an in-memory court and checks its expectations.
    // Throws verdict::error describing the first step or expectation that does not match.
    extern report_t replay(const boost::json::value &config, const boost::json::value &scenario);
    extern report_t replay_files(const std::string &config_path, const std::string &scenario_path);
}
