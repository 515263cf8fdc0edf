/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include "case.hpp"

namespace verdict::court {
    void record_vote(case_t &c, const address_t &juror, const bool approve)
    {
        if (c.phase != case_phase_t::voting || c.terminal()) [[unlikely]]
            throw err_case_not_voting_t {};
        if (c.jurors.find(juror) == c.jurors.end()) [[unlikely]]
            throw err_not_juror_t {};
        if (c.voted.find(juror) != c.voted.end()) [[unlikely]]
            throw err_already_voted_t {};
        auto &counter = approve ? c.votes_for : c.votes_against;
        if (counter == std::numeric_limits<uint64_t>::max()) [[unlikely]]
            throw err_arithmetic_overflow_t {};
        ++counter;
        if (c.votes_for + c.votes_against > c.jurors.size()) [[unlikely]]
            throw err_arithmetic_overflow_t {};
        c.voted.emplace(juror);
    }

    outcome_t evaluate_votes(case_t &c, const bool final_tally)
    {
        if (c.votes_for >= c.quorum) {
            c.phase = case_phase_t::approved;
            c.status = case_status_t::frozen;
            return outcome_t::approved_by_quorum;
        }
        if (final_tally || c.votes_for + c.votes_against >= c.jurors.size()) {
            c.status = case_status_t::closed;
            if (c.votes_for > c.votes_against) {
                c.phase = case_phase_t::approved;
                return outcome_t::approved_by_majority;
            }
            c.phase = case_phase_t::rejected;
            return outcome_t::rejected;
        }
        return outcome_t::pending;
    }
}
