#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstddef>
#include <string_view>

namespace verdict::court {
    // Deployment constants shared by every court instance
    struct config_base {
        // Hash domain of MPC computation identifiers
        static constexpr std::string_view mpc_domain { "verdict_mpc" };

        static constexpr size_t max_validators = 100;
        static constexpr size_t max_evidence_size = 256;
        static constexpr size_t max_jurors = 20;
        static constexpr size_t max_selection_attempts = 1000;

        // Oracle accounts start with a discriminator followed by the entropy
        static constexpr size_t oracle_header_size = 8;
        static constexpr size_t entropy_size = 32;
        static constexpr size_t min_oracle_data_size = oracle_header_size + entropy_size;

        static constexpr size_t mpc_max_jurors = 20;
        static constexpr size_t max_encrypted_tally_size = 256;
        static constexpr size_t partial_proof_size = 64;

        static constexpr size_t max_proof_size = 1024;
        static constexpr size_t max_public_inputs_size = 256;
        static_assert(max_jurors <= max_validators);
    };
}
