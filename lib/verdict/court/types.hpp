#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>
#include <boost/container/flat_set.hpp>
#include <verdict/codec/serializable.hpp>
#include <verdict/common/bytes.hpp>
#include "constants.hpp"

namespace verdict::court {
    template<size_t MAX=std::numeric_limits<size_t>::max()>
    struct byte_sequence_t: uint8_vector {
        static constexpr size_t max_size = MAX;
        using base_type = uint8_vector;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_bytes(*this, MAX);
        }
    };

    template<typename T, size_t MIN=0, size_t MAX=std::numeric_limits<size_t>::max()>
    struct sequence_t: std::vector<T> {
        static constexpr size_t min_size = MIN;
        static constexpr size_t max_size = MAX;
        static_assert(MIN <= MAX);
        using base_type = std::vector<T>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_array(*this, MIN, MAX);
        }
    };

    template<typename T, size_t MIN=0, size_t MAX=std::numeric_limits<size_t>::max()>
    struct set_t: boost::container::flat_set<T> {
        static constexpr size_t min_size = MIN;
        static constexpr size_t max_size = MAX;
        static_assert(MIN <= MAX);
        using base_type = boost::container::flat_set<T>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_array(*this, MIN, MAX);
        }
    };

    template<typename T>
    struct optional_t: std::optional<T> {
        using base_type = std::optional<T>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_optional(*this);
        }

        bool operator==(const optional_t &o) const noexcept
        {
            return static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
        }
    };

    template<size_t SZ>
    struct byte_array_t: byte_array<SZ> {
        using base_type = byte_array<SZ>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_bytes_fixed(*this);
        }
    };

    using case_id_t = uint64_t;
    using timestamp_t = int64_t;
    using address_t = byte_array_t<32>;
    using hash_t = byte_array_t<32>;
    using seed_t = byte_array_t<config_base::entropy_size>;
    using salt_t = byte_array_t<32>;
    using evidence_t = byte_sequence_t<config_base::max_evidence_size>;
    // Registration order is kept as it defines the sampling index of each validator
    using validator_list_t = sequence_t<address_t, 0, config_base::max_validators>;
    using juror_set_t = set_t<address_t, 0, config_base::max_jurors>;
    using voter_set_t = set_t<address_t, 0, config_base::max_jurors>;

    enum class case_status_t: uint8_t {
        open,
        closed,
        frozen
    };

    enum class case_phase_t: uint8_t {
        pending_jurors,
        voting,
        approved,
        rejected,
        executed
    };

    enum class mpc_state_t: uint8_t {
        initialized,
        collecting_shares,
        threshold_reached,
        complete
    };

    enum class proof_type_t: uint8_t {
        vote_commitment,
        evidence_hash,
        juror_eligibility,
        tally_verification
    };
}

namespace verdict::codec {
    template<>
    struct enum_traits<court::case_status_t> {
        static constexpr std::array<std::string_view, 3> names { "open", "closed", "frozen" };
    };

    template<>
    struct enum_traits<court::case_phase_t> {
        static constexpr std::array<std::string_view, 5> names { "pending_jurors", "voting", "approved", "rejected", "executed" };
    };

    template<>
    struct enum_traits<court::mpc_state_t> {
        static constexpr std::array<std::string_view, 4> names { "initialized", "collecting_shares", "threshold_reached", "complete" };
    };

    template<>
    struct enum_traits<court::proof_type_t> {
        static constexpr std::array<std::string_view, 4> names { "vote_commitment", "evidence_hash", "juror_eligibility", "tally_verification" };
    };
}

namespace verdict::court {
    struct case_t {
        case_id_t case_id = 0;
        address_t reporter {};
        address_t reported_address {};
        evidence_t evidence {};
        case_status_t status = case_status_t::open;
        case_phase_t phase = case_phase_t::pending_jurors;
        // the quorum in force when the jury was drawn
        uint32_t quorum = 0;
        validator_list_t juror_candidates {};
        juror_set_t jurors {};
        voter_set_t voted {};
        uint64_t votes_for = 0;
        uint64_t votes_against = 0;
        optional_t<address_t> randomness {};
        timestamp_t created_at = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("case_id"sv, case_id);
            archive.process("reporter"sv, reporter);
            archive.process("reported_address"sv, reported_address);
            archive.process("evidence"sv, evidence);
            archive.process("status"sv, status);
            archive.process("phase"sv, phase);
            archive.process("quorum"sv, quorum);
            archive.process("juror_candidates"sv, juror_candidates);
            archive.process("jurors"sv, jurors);
            archive.process("voted"sv, voted);
            archive.process("votes_for"sv, votes_for);
            archive.process("votes_against"sv, votes_against);
            archive.process("randomness"sv, randomness);
            archive.process("created_at"sv, created_at);
        }

        [[nodiscard]] bool terminal() const noexcept
        {
            return status != case_status_t::open;
        }

        bool operator==(const case_t &) const = default;
    };

    struct proof_t {
        proof_type_t proof_type = proof_type_t::vote_commitment;
        byte_sequence_t<config_base::max_proof_size> proof_data {};
        byte_sequence_t<config_base::max_public_inputs_size> public_inputs {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("proof_type"sv, proof_type);
            archive.process("proof_data"sv, proof_data);
            archive.process("public_inputs"sv, public_inputs);
        }

        bool operator==(const proof_t &) const = default;
    };

    struct vote_commitment_t {
        address_t juror {};
        case_id_t case_id = 0;
        hash_t commitment {};
        hash_t nullifier {};
        bool revealed = false;
        timestamp_t timestamp = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("juror"sv, juror);
            archive.process("case_id"sv, case_id);
            archive.process("commitment"sv, commitment);
            archive.process("nullifier"sv, nullifier);
            archive.process("revealed"sv, revealed);
            archive.process("timestamp"sv, timestamp);
        }

        bool operator==(const vote_commitment_t &) const = default;
    };

    struct mpc_session_t {
        case_id_t case_id = 0;
        uint8_t threshold = 0;
        uint8_t total_jurors = 0;
        uint8_t shares_received = 0;
        hash_t computation_id {};
        mpc_state_t state = mpc_state_t::initialized;
        timestamp_t created_at = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("case_id"sv, case_id);
            archive.process("threshold"sv, threshold);
            archive.process("total_jurors"sv, total_jurors);
            archive.process("shares_received"sv, shares_received);
            archive.process("computation_id"sv, computation_id);
            archive.process("state"sv, state);
            archive.process("created_at"sv, created_at);
        }

        bool operator==(const mpc_session_t &) const = default;
    };

    struct key_share_t {
        address_t juror {};
        case_id_t case_id = 0;
        uint8_t share_index = 0;
        byte_array_t<32> public_share {};
        hash_t commitment {};
        bool verified = false;
        timestamp_t timestamp = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("juror"sv, juror);
            archive.process("case_id"sv, case_id);
            archive.process("share_index"sv, share_index);
            archive.process("public_share"sv, public_share);
            archive.process("commitment"sv, commitment);
            archive.process("verified"sv, verified);
            archive.process("timestamp"sv, timestamp);
        }

        bool operator==(const key_share_t &) const = default;
    };

    struct partial_decryption_t {
        address_t juror {};
        byte_array_t<32> decryption_share {};
        byte_array_t<config_base::partial_proof_size> proof {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("juror"sv, juror);
            archive.process("decryption_share"sv, decryption_share);
            archive.process("proof"sv, proof);
        }

        bool operator==(const partial_decryption_t &) const = default;
    };
    using partial_decryptions_t = sequence_t<partial_decryption_t, 0, config_base::mpc_max_jurors>;

    struct vote_result_t {
        uint64_t votes_for = 0;
        uint64_t votes_against = 0;
        uint64_t total_votes = 0;
        bool verified = false;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("votes_for"sv, votes_for);
            archive.process("votes_against"sv, votes_against);
            archive.process("total_votes"sv, total_votes);
            archive.process("verified"sv, verified);
        }

        bool operator==(const vote_result_t &) const = default;
    };

    struct aggregation_t {
        case_id_t case_id = 0;
        optional_t<byte_sequence_t<config_base::max_encrypted_tally_size>> encrypted_tally {};
        partial_decryptions_t partial_decryptions {};
        optional_t<vote_result_t> final_result {};
        bool applied = false;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("case_id"sv, case_id);
            archive.process("encrypted_tally"sv, encrypted_tally);
            archive.process("partial_decryptions"sv, partial_decryptions);
            archive.process("final_result"sv, final_result);
            archive.process("applied"sv, applied);
        }

        [[nodiscard]] bool contains(const address_t &juror) const
        {
            for (const auto &pd: partial_decryptions) {
                if (pd.juror == juror)
                    return true;
            }
            return false;
        }

        bool operator==(const aggregation_t &) const = default;
    };

    // The handoff signal consumed by the asset freeze service
    struct freeze_request_t {
        case_id_t case_id = 0;
        address_t reported_address {};
        case_phase_t decision = case_phase_t::approved;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("case_id"sv, case_id);
            archive.process("reported_address"sv, reported_address);
            archive.process("decision"sv, decision);
        }

        bool operator==(const freeze_request_t &) const = default;
    };
}
