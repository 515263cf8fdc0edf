#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "errors.hpp"
#include "types.hpp"

namespace verdict::court::ballot {
    // H(vote_byte || salt) with H = BLAKE2b-256 and vote_byte 1 for approval and 0 otherwise
    extern hash_t commitment(bool approve, const salt_t &salt);
    // H(case_id_le64 || commitment)
    extern hash_t nullifier(case_id_t case_id, const hash_t &commitment);
    // The public inputs a vote commitment proof is bound to: case_id_le64 || commitment
    extern uint8_vector public_inputs(case_id_t case_id, const hash_t &commitment);
    // A proof in the layout accepted by structural_verifier_t
    extern proof_t structural_proof(case_id_t case_id, const hash_t &commitment);

    extern vote_commitment_t make_record(case_id_t case_id, const address_t &juror, const hash_t &commitment,
        const hash_t &nullifier, timestamp_t timestamp);

    // Marks the record revealed when H(vote || salt) matches the stored commitment.
    // A record can be revealed only once.
    extern void reveal(vote_commitment_t &rec, bool approve, const salt_t &salt);
}
