#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "errors.hpp"
#include "types.hpp"

namespace verdict::court::mpc {
    // H("verdict_mpc" || case_id_le64 || timestamp_le64)
    extern hash_t computation_id(case_id_t case_id, timestamp_t timestamp);

    // Requires 0 < threshold <= total_jurors <= mpc_max_jurors
    extern mpc_session_t make_session(case_id_t case_id, size_t threshold, size_t total_jurors, timestamp_t timestamp);

    // Registers the next key share. The session leaves initialized on the first share
    // and reaches threshold_reached once shares_received >= threshold.
    extern key_share_t add_share(mpc_session_t &session, const address_t &juror, const byte_array_t<32> &public_share,
        const hash_t &commitment, timestamp_t timestamp);

    // Appends a partial decryption and reports whether enough partials are collected to combine them.
    extern bool add_partial(const mpc_session_t &session, aggregation_t &aggregation, const partial_decryption_t &partial);

    // Stores the combined result and completes the session. The result can be set only once.
    extern void finalize(mpc_session_t &session, aggregation_t &aggregation, const vote_result_t &result);
}
