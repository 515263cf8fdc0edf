/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <boost/container/flat_set.hpp>
#include <verdict/codec/json.hpp>
#include <verdict/common/logger.hpp>
#include "registry.hpp"

namespace verdict::court {
    uint32_t registry_t::default_quorum(const uint32_t min_jurors)
    {
        return min_jurors * 2 / 3 + 1;
    }

    registry_t registry_t::from_config(const registry_config_t &cfg)
    {
        const auto quorum = cfg.quorum ? *cfg.quorum : default_quorum(cfg.min_jurors);
        if (cfg.validators.size() > config_base::max_validators) [[unlikely]]
            throw err_too_many_validators_t {};
        return registry_t { cfg.admin, cfg.min_jurors, quorum, validator_list_t { cfg.validators.begin(), cfg.validators.end() } };
    }

    registry_t registry_t::load(const std::string &path)
    {
        const auto cfg = codec::json::load_obj<registry_config_t>(path);
        logger::info("loaded the deployment config from {}: {} validators min_jurors: {}", path, cfg.validators.size(), cfg.min_jurors);
        return from_config(cfg);
    }

    registry_t::registry_t(const address_t &admin, const uint32_t min_jurors, const uint32_t quorum, validator_list_t validators):
        _admin { admin },
        _min_jurors { min_jurors },
        _quorum { quorum },
        _validators { std::move(validators) }
    {
        if (_min_jurors == 0) [[unlikely]]
            throw err_invalid_quorum_t {};
        if (_min_jurors > config_base::max_jurors) [[unlikely]]
            throw err_too_many_jurors_t {};
        if (_quorum == 0 || _quorum > _min_jurors) [[unlikely]]
            throw err_invalid_quorum_t {};
        _check_validators(_validators);
    }

    void registry_t::set_validators(const address_t &caller, validator_list_t validators)
    {
        if (caller != _admin) [[unlikely]]
            throw err_unauthorized_t {};
        _check_validators(validators);
        _validators = std::move(validators);
        logger::info("registry: the validator list was replaced, now {} validators", _validators.size());
    }

    void registry_t::sync_validators(const address_t &caller, validator_list_t validators)
    {
        const auto prev_size = _validators.size();
        set_validators(caller, std::move(validators));
        logger::info("registry: validator sync {} -> {}", prev_size, _validators.size());
    }

    bool registry_t::contains(const address_t &addr) const
    {
        return std::find(_validators.begin(), _validators.end(), addr) != _validators.end();
    }

    registry_config_t registry_t::config() const
    {
        registry_config_t cfg {};
        cfg.admin = _admin;
        cfg.quorum.emplace(_quorum);
        cfg.min_jurors = _min_jurors;
        cfg.validators.assign(_validators.begin(), _validators.end());
        return cfg;
    }

    void registry_t::_check_validators(const validator_list_t &validators)
    {
        if (validators.size() > config_base::max_validators) [[unlikely]]
            throw err_too_many_validators_t {};
        boost::container::flat_set<address_t> seen {};
        seen.reserve(validators.size());
        for (const auto &v: validators) {
            if (!seen.emplace(v).second) [[unlikely]]
                throw err_duplicate_validator_t {};
        }
    }
}
