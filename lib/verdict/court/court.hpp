#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <optional>
#include <verdict/storage/common.hpp>
#include "errors.hpp"
#include "randomness.hpp"
#include "registry.hpp"
#include "selection.hpp"
#include "types.hpp"
#include "verifier.hpp"

namespace verdict::court {
    using clock_fn_t = std::function<timestamp_t()>;

    extern timestamp_t system_clock_now();

    // Storage keys: a prefix byte, the little-endian case_id and, for per-juror records, the juror address
    namespace keys {
        enum class prefix_t: uint8_t {
            case_record = 0x01,
            commitment = 0x02,
            nullifier = 0x03,
            mpc_session = 0x04,
            key_share = 0x05,
            aggregation = 0x06
        };

        extern uint8_vector make(prefix_t prefix, case_id_t case_id);
        extern uint8_vector make(prefix_t prefix, case_id_t case_id, const byte_array<32> &suffix);
    }

    // External collaborators of the court. The strategy and the verifier have defaults.
    struct services_t {
        std::shared_ptr<const randomness::oracle_t> oracle {};
        freeze_service_ptr_t freeze {};
        combiner_ptr_t combiner {};
        verifier_ptr_t verifier = std::make_shared<structural_verifier_t>();
        selection::strategy_ptr_t strategy = std::make_shared<selection::rejection_sampling_t>();
        clock_fn_t clock = system_clock_now;
    };

    // The case lifecycle and juror-consensus engine.
    // Every operation either applies all of its updates to the storage or none of them.
    // N.B. operations on the same case must be serialized by the caller!
    struct court_t {
        court_t(storage::db_ptr_t db, services_t services);
        ~court_t();

        // Case creation and jury selection
        void submit_case(const address_t &reporter, case_id_t case_id, const address_t &reported_address, buffer evidence);
        void request_randomness(case_id_t case_id, const address_t &oracle_account);
        void select_jurors(case_id_t case_id, const registry_t &registry);
        void select_jurors(case_id_t case_id, const registry_t &registry, const address_t &oracle_account);

        // Public and private voting
        void vote(case_id_t case_id, const address_t &juror, bool approve);
        void commit_vote(case_id_t case_id, const address_t &juror, const hash_t &commitment, const hash_t &nullifier, const proof_t &proof);
        void reveal_vote(case_id_t case_id, const address_t &juror, bool approve, const salt_t &salt);

        // Threshold decryption
        void init_mpc(case_id_t case_id, size_t threshold, size_t total_jurors);
        void submit_share(case_id_t case_id, const address_t &juror, const byte_array_t<32> &public_share, const hash_t &commitment);
        void verify_share(case_id_t case_id, const address_t &juror);
        void submit_encrypted_tally(case_id_t case_id, buffer encrypted_tally);
        void submit_partial_decryption(case_id_t case_id, const address_t &juror, const byte_array_t<32> &decryption_share,
            const byte_array_t<config_base::partial_proof_size> &proof);
        void apply_mpc_result(case_id_t case_id);

        [[nodiscard]] case_t get_case(case_id_t case_id) const;
        [[nodiscard]] std::optional<case_t> find_case(case_id_t case_id) const;
        [[nodiscard]] std::optional<vote_commitment_t> get_commitment(case_id_t case_id, const address_t &juror) const;
        [[nodiscard]] std::optional<mpc_session_t> get_mpc_session(case_id_t case_id) const;
        [[nodiscard]] std::optional<key_share_t> get_key_share(case_id_t case_id, const address_t &juror) const;
        [[nodiscard]] std::optional<aggregation_t> get_aggregation(case_id_t case_id) const;
        [[nodiscard]] std::vector<case_t> cases() const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
