#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <variant>
#include <verdict/common/error.hpp>

namespace verdict::court {
    // Authorization
    struct err_unauthorized_t final: error {
        err_unauthorized_t(): error { "err_unauthorized_t" } {}
        bool operator==(const err_unauthorized_t &) const { return true; }
        void serialize(auto &) {}
    };

    // Precondition and state
    struct err_invalid_case_t final: error {
        err_invalid_case_t(): error { "err_invalid_case_t" } {}
        bool operator==(const err_invalid_case_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_case_not_open_t final: error {
        err_case_not_open_t(): error { "err_case_not_open_t" } {}
        bool operator==(const err_case_not_open_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_case_not_voting_t final: error {
        err_case_not_voting_t(): error { "err_case_not_voting_t" } {}
        bool operator==(const err_case_not_voting_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_case_already_exists_t final: error {
        err_case_already_exists_t(): error { "err_case_already_exists_t" } {}
        bool operator==(const err_case_already_exists_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_vrf_not_ready_t final: error {
        err_vrf_not_ready_t(): error { "err_vrf_not_ready_t" } {}
        bool operator==(const err_vrf_not_ready_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_randomness_t final: error {
        err_invalid_randomness_t(): error { "err_invalid_randomness_t" } {}
        bool operator==(const err_invalid_randomness_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_threshold_not_reached_t final: error {
        err_threshold_not_reached_t(): error { "err_threshold_not_reached_t" } {}
        bool operator==(const err_threshold_not_reached_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_mpc_not_initialized_t final: error {
        err_mpc_not_initialized_t(): error { "err_mpc_not_initialized_t" } {}
        bool operator==(const err_mpc_not_initialized_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_mpc_already_initialized_t final: error {
        err_mpc_already_initialized_t(): error { "err_mpc_already_initialized_t" } {}
        bool operator==(const err_mpc_already_initialized_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_computation_complete_t final: error {
        err_computation_complete_t(): error { "err_computation_complete_t" } {}
        bool operator==(const err_computation_complete_t &) const { return true; }
        void serialize(auto &) {}
    };

    // Capacity
    struct err_not_enough_validators_t final: error {
        err_not_enough_validators_t(): error { "err_not_enough_validators_t" } {}
        bool operator==(const err_not_enough_validators_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_too_many_validators_t final: error {
        err_too_many_validators_t(): error { "err_too_many_validators_t" } {}
        bool operator==(const err_too_many_validators_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_too_many_jurors_t final: error {
        err_too_many_jurors_t(): error { "err_too_many_jurors_t" } {}
        bool operator==(const err_too_many_jurors_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_evidence_too_large_t final: error {
        err_evidence_too_large_t(): error { "err_evidence_too_large_t" } {}
        bool operator==(const err_evidence_too_large_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_all_shares_submitted_t final: error {
        err_all_shares_submitted_t(): error { "err_all_shares_submitted_t" } {}
        bool operator==(const err_all_shares_submitted_t &) const { return true; }
        void serialize(auto &) {}
    };

    // Integrity
    struct err_not_juror_t final: error {
        err_not_juror_t(): error { "err_not_juror_t" } {}
        bool operator==(const err_not_juror_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_already_voted_t final: error {
        err_already_voted_t(): error { "err_already_voted_t" } {}
        bool operator==(const err_already_voted_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_zk_proof_t final: error {
        err_invalid_zk_proof_t(): error { "err_invalid_zk_proof_t" } {}
        bool operator==(const err_invalid_zk_proof_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_proof_type_t final: error {
        err_invalid_proof_type_t(): error { "err_invalid_proof_type_t" } {}
        bool operator==(const err_invalid_proof_type_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_reveal_t final: error {
        err_invalid_reveal_t(): error { "err_invalid_reveal_t" } {}
        bool operator==(const err_invalid_reveal_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_nullifier_already_used_t final: error {
        err_nullifier_already_used_t(): error { "err_nullifier_already_used_t" } {}
        bool operator==(const err_nullifier_already_used_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_duplicate_validator_t final: error {
        err_duplicate_validator_t(): error { "err_duplicate_validator_t" } {}
        bool operator==(const err_duplicate_validator_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_share_not_verified_t final: error {
        err_share_not_verified_t(): error { "err_share_not_verified_t" } {}
        bool operator==(const err_share_not_verified_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_share_already_submitted_t final: error {
        err_share_already_submitted_t(): error { "err_share_already_submitted_t" } {}
        bool operator==(const err_share_already_submitted_t &) const { return true; }
        void serialize(auto &) {}
    };

    // Configuration
    struct err_invalid_threshold_t final: error {
        err_invalid_threshold_t(): error { "err_invalid_threshold_t" } {}
        bool operator==(const err_invalid_threshold_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_invalid_quorum_t final: error {
        err_invalid_quorum_t(): error { "err_invalid_quorum_t" } {}
        bool operator==(const err_invalid_quorum_t &) const { return true; }
        void serialize(auto &) {}
    };

    // Resource exhaustion
    struct err_juror_selection_failed_t final: error {
        err_juror_selection_failed_t(): error { "err_juror_selection_failed_t" } {}
        bool operator==(const err_juror_selection_failed_t &) const { return true; }
        void serialize(auto &) {}
    };
    struct err_arithmetic_overflow_t final: error {
        err_arithmetic_overflow_t(): error { "err_arithmetic_overflow_t" } {}
        bool operator==(const err_arithmetic_overflow_t &) const { return true; }
        void serialize(auto &) {}
    };

    template<typename BASE_T, typename BASE_V>
    struct err_group_t: BASE_V {
        using base_type = BASE_V;
        using base_type::base_type;

        static void catch_into(const std::function<void()> &action, const std::function<void(BASE_T)> &on_error)
        {
            if constexpr (std::variant_size_v<BASE_V> > 0) {
                catch_into_impl<std::variant_size_v<BASE_V> - 1>(action, on_error);
            }
        }
    private:
        template<size_t I>
        static void catch_into_impl(const std::function<void()> &action, const std::function<void(BASE_T)> &on_error)
        {
            if constexpr (I == 0) {
                try {
                    action();
                } catch (std::variant_alternative_t<I, BASE_V> &err) {
                    on_error(std::move(err));
                }
            } else {
                try {
                    catch_into_impl<I - 1>(action, on_error);
                } catch (std::variant_alternative_t<I, BASE_V> &err) {
                    on_error(std::move(err));
                }
            }
        }
    };

    // Every typed failure the court can raise
    using court_error_variant_t = std::variant<
        err_unauthorized_t,
        err_invalid_case_t,
        err_case_not_open_t,
        err_case_not_voting_t,
        err_case_already_exists_t,
        err_vrf_not_ready_t,
        err_invalid_randomness_t,
        err_threshold_not_reached_t,
        err_mpc_not_initialized_t,
        err_mpc_already_initialized_t,
        err_computation_complete_t,
        err_not_enough_validators_t,
        err_too_many_validators_t,
        err_too_many_jurors_t,
        err_evidence_too_large_t,
        err_all_shares_submitted_t,
        err_not_juror_t,
        err_already_voted_t,
        err_invalid_zk_proof_t,
        err_invalid_proof_type_t,
        err_invalid_reveal_t,
        err_nullifier_already_used_t,
        err_duplicate_validator_t,
        err_share_not_verified_t,
        err_share_already_submitted_t,
        err_invalid_threshold_t,
        err_invalid_quorum_t,
        err_juror_selection_failed_t,
        err_arithmetic_overflow_t
    >;

    struct court_error_t final: err_group_t<court_error_t, court_error_variant_t> {
        using base_type = err_group_t<court_error_t, court_error_variant_t>;
        using base_type::base_type;

        [[nodiscard]] std::string_view name() const;
    };
}
