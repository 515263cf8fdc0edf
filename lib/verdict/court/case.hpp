#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "errors.hpp"
#include "types.hpp"

namespace verdict::court {
    enum class outcome_t: uint8_t {
        pending,
        approved_by_quorum,
        approved_by_majority,
        rejected
    };

    // Counts a juror's vote. Each juror is counted at most once per case.
    extern void record_vote(case_t &c, const address_t &juror, bool approve);

    // Applies the quorum rules to the recorded votes:
    // approval once votes_for reaches the quorum (the case is frozen),
    // otherwise a simple majority once every juror has voted with ties rejected.
    // final_tally decides by majority even when some jurors did not vote.
    extern outcome_t evaluate_votes(case_t &c, bool final_tally=false);
}

namespace verdict::codec {
    template<>
    struct enum_traits<court::outcome_t> {
        static constexpr std::array<std::string_view, 4> names { "pending", "approved_by_quorum", "approved_by_majority", "rejected" };
    };
}
