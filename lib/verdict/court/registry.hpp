#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include "errors.hpp"
#include "types.hpp"

namespace verdict::court {
    // The deployment config as it appears in JSON. quorum may be omitted.
    // validators is unbounded here so that the registry reports an oversized list with a typed error.
    struct registry_config_t {
        address_t admin {};
        optional_t<uint32_t> quorum {};
        uint32_t min_jurors = 0;
        sequence_t<address_t> validators {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("admin"sv, admin);
            archive.process("quorum"sv, quorum);
            archive.process("min_jurors"sv, min_jurors);
            archive.process("validators"sv, validators);
        }

        bool operator==(const registry_config_t &) const = default;
    };

    // Admin-curated set of validators eligible for jury duty.
    // Constructed once per deployment and passed explicitly to the operations that need it.
    struct registry_t {
        static uint32_t default_quorum(uint32_t min_jurors);
        static registry_t from_config(const registry_config_t &cfg);
        static registry_t load(const std::string &path);

        registry_t(const address_t &admin, uint32_t min_jurors, uint32_t quorum, validator_list_t validators);

        // Replaces the whole validator list. Cases already in voting are not re-checked.
        void set_validators(const address_t &caller, validator_list_t validators);
        void sync_validators(const address_t &caller, validator_list_t validators);

        [[nodiscard]] bool contains(const address_t &addr) const;

        [[nodiscard]] const address_t &admin() const noexcept
        {
            return _admin;
        }

        [[nodiscard]] uint32_t quorum() const noexcept
        {
            return _quorum;
        }

        [[nodiscard]] uint32_t min_jurors() const noexcept
        {
            return _min_jurors;
        }

        [[nodiscard]] const validator_list_t &validators() const noexcept
        {
            return _validators;
        }

        [[nodiscard]] registry_config_t config() const;
    private:
        address_t _admin;
        uint32_t _min_jurors;
        uint32_t _quorum;
        validator_list_t _validators;

        static void _check_validators(const validator_list_t &validators);
    };
}
