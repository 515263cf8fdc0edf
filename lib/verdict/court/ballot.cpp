/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/codec/binary.hpp>
#include <verdict/crypto/blake2b.hpp>
#include "ballot.hpp"

namespace verdict::court::ballot {
    hash_t commitment(const bool approve, const salt_t &salt)
    {
        const byte_array<1> vote_byte { static_cast<uint8_t>(approve ? 1 : 0) };
        return crypto::blake2b::digest<hash_t>({ vote_byte, salt });
    }

    hash_t nullifier(const case_id_t case_id, const hash_t &commitment)
    {
        return crypto::blake2b::digest<hash_t>(public_inputs(case_id, commitment));
    }

    uint8_vector public_inputs(const case_id_t case_id, const hash_t &commitment)
    {
        codec::binary::encoder enc { case_id };
        enc.bytes() << commitment;
        return std::move(enc.bytes());
    }

    proof_t structural_proof(const case_id_t case_id, const hash_t &commitment)
    {
        proof_t proof {};
        proof.proof_type = proof_type_t::vote_commitment;
        const auto nf = nullifier(case_id, commitment);
        proof.proof_data.assign(nf.begin(), nf.end());
        const auto inputs = public_inputs(case_id, commitment);
        proof.public_inputs.assign(inputs.begin(), inputs.end());
        return proof;
    }

    vote_commitment_t make_record(const case_id_t case_id, const address_t &juror, const hash_t &commitment,
        const hash_t &nullifier, const timestamp_t timestamp)
    {
        vote_commitment_t rec {};
        rec.juror = juror;
        rec.case_id = case_id;
        rec.commitment = commitment;
        rec.nullifier = nullifier;
        rec.timestamp = timestamp;
        return rec;
    }

    void reveal(vote_commitment_t &rec, const bool approve, const salt_t &salt)
    {
        if (rec.revealed) [[unlikely]]
            throw err_already_voted_t {};
        if (commitment(approve, salt) != rec.commitment) [[unlikely]]
            throw err_invalid_reveal_t {};
        rec.revealed = true;
    }
}
