/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/test.hpp>
#include "case.hpp"

namespace {
    using namespace verdict;
    using namespace verdict::court;

    address_t addr(const uint8_t b)
    {
        address_t a {};
        a.fill(b);
        return a;
    }

    case_t voting_case(const uint32_t quorum, const std::initializer_list<uint8_t> jurors)
    {
        case_t c {};
        c.case_id = 1;
        c.phase = case_phase_t::voting;
        c.quorum = quorum;
        for (const auto j: jurors)
            c.jurors.emplace(addr(j));
        return c;
    }
}

suite verdict_court_case_suite = [] {
    "verdict::court::case"_test = [] {
        "record_vote"_test = [] {
            auto c = voting_case(2, { 0x0A, 0x0C, 0x0E });
            record_vote(c, addr(0x0A), true);
            record_vote(c, addr(0x0C), false);
            expect_equal(uint64_t { 1 }, c.votes_for);
            expect_equal(uint64_t { 1 }, c.votes_against);
            expect_equal(size_t { 2 }, c.voted.size());
            expect(throws<err_already_voted_t>([&] { record_vote(c, addr(0x0A), false); }));
            expect(throws<err_not_juror_t>([&] { record_vote(c, addr(0x0B), true); }));
            expect_equal(uint64_t { 1 }, c.votes_against);
            auto pending = voting_case(2, { 0x0A });
            pending.phase = case_phase_t::pending_jurors;
            expect(throws<err_case_not_voting_t>([&] { record_vote(pending, addr(0x0A), true); }));
            auto frozen = voting_case(2, { 0x0A });
            frozen.status = case_status_t::frozen;
            expect(throws<err_case_not_voting_t>([&] { record_vote(frozen, addr(0x0A), true); }));
        };
        "record_vote overflow"_test = [] {
            auto c = voting_case(2, { 0x0A, 0x0C });
            c.votes_for = 2;
            expect(throws<err_arithmetic_overflow_t>([&] { record_vote(c, addr(0x0A), true); }));
            expect(c.voted.empty());
        };
        "approval by quorum"_test = [] {
            auto c = voting_case(2, { 0x0A, 0x0C, 0x0E });
            record_vote(c, addr(0x0A), true);
            expect(evaluate_votes(c) == outcome_t::pending);
            expect(c.status == case_status_t::open);
            record_vote(c, addr(0x0C), true);
            expect(evaluate_votes(c) == outcome_t::approved_by_quorum);
            expect(c.status == case_status_t::frozen);
            expect(c.phase == case_phase_t::approved);
        };
        "majority once everyone voted"_test = [] {
            auto approved = voting_case(3, { 0x0A, 0x0C, 0x0E });
            record_vote(approved, addr(0x0A), true);
            record_vote(approved, addr(0x0C), false);
            expect(evaluate_votes(approved) == outcome_t::pending);
            record_vote(approved, addr(0x0E), true);
            expect(evaluate_votes(approved) == outcome_t::approved_by_majority);
            expect(approved.status == case_status_t::closed);
            expect(approved.phase == case_phase_t::approved);
            auto rejected = voting_case(3, { 0x0A, 0x0C, 0x0E });
            record_vote(rejected, addr(0x0A), false);
            record_vote(rejected, addr(0x0C), false);
            record_vote(rejected, addr(0x0E), true);
            expect(evaluate_votes(rejected) == outcome_t::rejected);
            expect(rejected.status == case_status_t::closed);
            expect(rejected.phase == case_phase_t::rejected);
        };
        "ties are rejected"_test = [] {
            auto c = voting_case(4, { 0x0A, 0x0B, 0x0C, 0x0D });
            record_vote(c, addr(0x0A), true);
            record_vote(c, addr(0x0B), true);
            record_vote(c, addr(0x0C), false);
            record_vote(c, addr(0x0D), false);
            expect(evaluate_votes(c) == outcome_t::rejected);
            expect(c.phase == case_phase_t::rejected);
        };
        "final tally"_test = [] {
            auto c = voting_case(3, { 0x0A, 0x0C, 0x0E });
            c.votes_for = 1;
            expect(evaluate_votes(c) == outcome_t::pending);
            expect(evaluate_votes(c, true) == outcome_t::approved_by_majority);
            auto empty = voting_case(3, { 0x0A, 0x0C, 0x0E });
            expect(evaluate_votes(empty, true) == outcome_t::rejected);
        };
    };
};
