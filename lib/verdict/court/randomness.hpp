#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <optional>
#include "errors.hpp"
#include "types.hpp"

namespace verdict::court::randomness {
    // Read access to the accounts of the external randomness oracle.
    struct oracle_t {
        virtual ~oracle_t() = default;
        // Returns std::nullopt when the account does not exist yet
        [[nodiscard]] virtual std::optional<uint8_vector> account_data(const address_t &account) const = 0;
    };

    // An oracle backed by a map of account contents.
    struct memory_oracle_t final: oracle_t {
        [[nodiscard]] std::optional<uint8_vector> account_data(const address_t &account) const override;
        void post(const address_t &account, buffer data);
        void erase(const address_t &account);
    private:
        std::map<address_t, uint8_vector> _accounts {};
    };

    // Raises err_vrf_not_ready_t when the account is missing, too short, or carries no entropy yet.
    extern seed_t extract_seed(buffer account_data);
    extern seed_t extract_seed(const oracle_t &oracle, const address_t &account);
}
