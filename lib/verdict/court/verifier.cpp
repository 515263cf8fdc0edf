/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/codec/binary.hpp>
#include <verdict/common/logger.hpp>
#include <verdict/crypto/blake2b.hpp>
#include "verifier.hpp"

namespace verdict::court {
    bool structural_verifier_t::verify_vote_proof(const case_id_t case_id, const hash_t &commitment,
        const hash_t &nullifier, const proof_t &proof) const
    {
        static constexpr size_t case_id_size = sizeof(case_id_t);
        if (proof.proof_data.size() < nullifier.size()
                || proof.public_inputs.size() < case_id_size + commitment.size()) {
            logger::debug("structural_verifier: a truncated proof for case {}", case_id);
            return false;
        }
        const buffer inputs = proof.public_inputs;
        codec::binary::decoder dec { inputs.subbuf(0, case_id_size) };
        const auto proof_case_id = dec.uint_fixed<case_id_t>(case_id_size);
        const hash_t proof_commitment { inputs.subbuf(case_id_size, commitment.size()) };
        if (proof_case_id != case_id || proof_commitment != commitment || proof_commitment.is_zero()) {
            logger::debug("structural_verifier: public inputs of a proof do not match case {}", case_id);
            return false;
        }
        return static_cast<buffer>(proof.proof_data).subbuf(0, nullifier.size()) == static_cast<buffer>(nullifier);
    }

    bool structural_verifier_t::verify_key_share(const key_share_t &share) const
    {
        return !share.public_share.is_zero() && key_share_commitment(share.public_share) == share.commitment;
    }

    hash_t key_share_commitment(const buffer public_share)
    {
        return crypto::blake2b::digest<hash_t>(public_share);
    }
}
