#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include "types.hpp"

namespace verdict::court {
    // Checks the cryptographic proofs that accompany private votes and MPC key shares
    struct verifier_t {
        virtual ~verifier_t() = default;
        [[nodiscard]] virtual bool verify_vote_proof(case_id_t case_id, const hash_t &commitment,
            const hash_t &nullifier, const proof_t &proof) const = 0;
        [[nodiscard]] virtual bool verify_key_share(const key_share_t &share) const = 0;
    };
    using verifier_ptr_t = std::shared_ptr<const verifier_t>;

    // Recombines the partial decryptions of a threshold-encrypted tally
    struct combiner_t {
        virtual ~combiner_t() = default;
        [[nodiscard]] virtual vote_result_t combine(const mpc_session_t &session, const aggregation_t &aggregation) const = 0;
    };
    using combiner_ptr_t = std::shared_ptr<const combiner_t>;

    // Receives the decision of a case approved by quorum. Called exactly once per case.
    struct freeze_service_t {
        virtual ~freeze_service_t() = default;
        virtual void freeze(const freeze_request_t &req) = 0;
    };
    using freeze_service_ptr_t = std::shared_ptr<freeze_service_t>;

    // Format-level checks for deployments without a proof system:
    // a vote proof must carry public inputs case_id_le64 || commitment with a non-zero commitment
    // and proof data that starts with the nullifier; a key share commitment must be H(public_share).
    struct structural_verifier_t final: verifier_t {
        [[nodiscard]] bool verify_vote_proof(case_id_t case_id, const hash_t &commitment,
            const hash_t &nullifier, const proof_t &proof) const override;
        [[nodiscard]] bool verify_key_share(const key_share_t &share) const override;
    };

    // Returns the H(public_share) commitment expected by structural_verifier_t
    extern hash_t key_share_commitment(buffer public_share);
}
