/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/test.hpp>
#include "ballot.hpp"
#include "verifier.hpp"

namespace {
    using namespace verdict;
    using namespace verdict::court;
}

suite verdict_court_verifier_suite = [] {
    "verdict::court::structural_verifier"_test = [] {
        const structural_verifier_t verifier {};
        const auto salt = salt_t::from_hex<salt_t>("0101010101010101010101010101010101010101010101010101010101010101");
        "vote proof"_test = [&] {
            const auto c = ballot::commitment(true, salt);
            const auto nf = ballot::nullifier(3, c);
            const auto proof = ballot::structural_proof(3, c);
            expect(verifier.verify_vote_proof(3, c, nf, proof));
            // bound to the case
            expect(!verifier.verify_vote_proof(4, c, nf, proof));
            // bound to the commitment
            expect(!verifier.verify_vote_proof(3, ballot::commitment(false, salt), nf, proof));
            auto truncated = proof;
            truncated.proof_data.resize(16);
            expect(!verifier.verify_vote_proof(3, c, nf, truncated));
            auto tampered = proof;
            tampered.proof_data[0] ^= 0xFF;
            expect(!verifier.verify_vote_proof(3, c, nf, tampered));
            auto short_inputs = proof;
            short_inputs.public_inputs.resize(8);
            expect(!verifier.verify_vote_proof(3, c, nf, short_inputs));
            // a zero commitment is never accepted
            const hash_t zero {};
            expect(!verifier.verify_vote_proof(3, zero, ballot::nullifier(3, zero), ballot::structural_proof(3, zero)));
        };
        "key share"_test = [&] {
            key_share_t share {};
            share.public_share.fill(0x42);
            share.commitment = key_share_commitment(share.public_share);
            expect(verifier.verify_key_share(share));
            share.commitment[31] ^= 1;
            expect(!verifier.verify_key_share(share));
            key_share_t zero_share {};
            zero_share.commitment = key_share_commitment(zero_share.public_share);
            expect(!verifier.verify_key_share(zero_share));
        };
    };
};
