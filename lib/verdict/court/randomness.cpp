/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/logger.hpp>
#include "randomness.hpp"

namespace verdict::court::randomness {
    std::optional<uint8_vector> memory_oracle_t::account_data(const address_t &account) const
    {
        if (const auto it = _accounts.find(account); it != _accounts.end())
            return it->second;
        return {};
    }

    void memory_oracle_t::post(const address_t &account, const buffer data)
    {
        _accounts.insert_or_assign(account, uint8_vector { data });
    }

    void memory_oracle_t::erase(const address_t &account)
    {
        _accounts.erase(account);
    }

    seed_t extract_seed(const buffer account_data)
    {
        if (account_data.size() < config_base::min_oracle_data_size) [[unlikely]]
            throw err_vrf_not_ready_t {};
        const seed_t seed { account_data.subbuf(config_base::oracle_header_size, config_base::entropy_size) };
        // the oracle allocates the account before it reveals the entropy
        if (seed.is_zero()) [[unlikely]]
            throw err_vrf_not_ready_t {};
        return seed;
    }

    seed_t extract_seed(const oracle_t &oracle, const address_t &account)
    {
        const auto data = oracle.account_data(account);
        if (!data) [[unlikely]] {
            logger::debug("randomness: oracle account {} does not exist", account);
            throw err_vrf_not_ready_t {};
        }
        return extract_seed(*data);
    }
}
