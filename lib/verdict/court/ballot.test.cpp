/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/test.hpp>
#include <verdict/crypto/blake2b.hpp>
#include "ballot.hpp"

namespace {
    using namespace verdict;
    using namespace verdict::court;
}

suite verdict_court_ballot_suite = [] {
    "verdict::court::ballot"_test = [] {
        const auto salt = salt_t::from_hex<salt_t>("5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a");
        const auto other_salt = salt_t::from_hex<salt_t>("a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5");
        "commitment"_test = [&] {
            const auto yes = ballot::commitment(true, salt);
            expect_equal(crypto::blake2b::digest<hash_t>({ uint8_vector::from_hex("01"), salt }), yes);
            expect(yes != ballot::commitment(false, salt));
            expect(yes != ballot::commitment(true, other_salt));
        };
        "nullifier"_test = [&] {
            const auto c = ballot::commitment(false, salt);
            const auto inputs = ballot::public_inputs(0x0102, c);
            expect_equal(size_t { 40 }, inputs.size());
            expect(static_cast<buffer>(inputs).subbuf(0, 8) == buffer { uint8_vector::from_hex("0201000000000000") });
            expect_equal(crypto::blake2b::digest<hash_t>(inputs), ballot::nullifier(0x0102, c));
            // the same commitment has a different nullifier in another case
            expect(ballot::nullifier(0x0102, c) != ballot::nullifier(0x0103, c));
        };
        "structural proof"_test = [&] {
            const auto c = ballot::commitment(true, salt);
            const auto proof = ballot::structural_proof(7, c);
            expect(proof.proof_type == proof_type_t::vote_commitment);
            expect_equal(ballot::public_inputs(7, c), static_cast<const uint8_vector &>(proof.public_inputs));
            expect(static_cast<buffer>(proof.proof_data) == static_cast<buffer>(ballot::nullifier(7, c)));
        };
        "reveal"_test = [&] {
            const auto c = ballot::commitment(true, salt);
            address_t juror {};
            juror.fill(0x0A);
            auto rec = ballot::make_record(7, juror, c, ballot::nullifier(7, c), 1000);
            expect(!rec.revealed);
            expect_equal(int64_t { 1000 }, rec.timestamp);
            expect(throws<err_invalid_reveal_t>([&] { ballot::reveal(rec, false, salt); }));
            expect(throws<err_invalid_reveal_t>([&] { ballot::reveal(rec, true, other_salt); }));
            expect(!rec.revealed);
            ballot::reveal(rec, true, salt);
            expect(rec.revealed);
            expect(throws<err_already_voted_t>([&] { ballot::reveal(rec, true, salt); }));
        };
    };
};
