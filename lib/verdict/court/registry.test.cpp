/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/codec/json.hpp>
#include <verdict/common/test.hpp>
#include "registry.hpp"

namespace {
    using namespace verdict;
    using namespace verdict::court;

    address_t addr(const uint8_t b)
    {
        address_t a {};
        a.fill(b);
        return a;
    }

    validator_list_t validators(const uint8_t first, const size_t n)
    {
        validator_list_t res {};
        for (size_t i = 0; i < n; ++i)
            res.emplace_back(addr(static_cast<uint8_t>(first + i)));
        return res;
    }
}

suite verdict_court_registry_suite = [] {
    using boost::ut::nothrow;
    "verdict::court::registry"_test = [] {
        const auto admin = addr(0xAD);
        "default quorum"_test = [] {
            expect_equal(uint32_t { 3 }, registry_t::default_quorum(3));
            expect_equal(uint32_t { 4 }, registry_t::default_quorum(5));
            expect_equal(uint32_t { 14 }, registry_t::default_quorum(20));
        };
        "construction"_test = [&] {
            const registry_t reg { admin, 3, 2, validators(0x0A, 5) };
            expect_equal(uint32_t { 2 }, reg.quorum());
            expect_equal(uint32_t { 3 }, reg.min_jurors());
            expect_equal(size_t { 5 }, reg.validators().size());
            expect(reg.contains(addr(0x0C)));
            expect(!reg.contains(addr(0x0F)));
            expect(throws<err_invalid_quorum_t>([&] { registry_t { admin, 0, 1, validators(0x0A, 5) }; }));
            expect(throws<err_too_many_jurors_t>([&] { registry_t { admin, 21, 1, validators(0x0A, 5) }; }));
            expect(throws<err_invalid_quorum_t>([&] { registry_t { admin, 3, 0, validators(0x0A, 5) }; }));
            expect(throws<err_invalid_quorum_t>([&] { registry_t { admin, 3, 4, validators(0x0A, 5) }; }));
            expect(throws<err_too_many_validators_t>([&] { registry_t { admin, 3, 2, validators(0x00, 101) }; }));
            auto dup = validators(0x0A, 3);
            dup.emplace_back(addr(0x0B));
            expect(throws<err_duplicate_validator_t>([&] { registry_t { admin, 3, 2, dup }; }));
            // fewer validators than jurors is accepted until a jury is drawn
            expect(nothrow([&] { registry_t { admin, 3, 2, validators(0x0A, 2) }; }));
        };
        "set_validators"_test = [&] {
            registry_t reg { admin, 3, 2, validators(0x0A, 5) };
            expect(throws<err_unauthorized_t>([&] { reg.set_validators(addr(0x0A), validators(0x20, 4)); }));
            expect_equal(size_t { 5 }, reg.validators().size());
            auto dup = validators(0x20, 2);
            dup.emplace_back(addr(0x20));
            expect(throws<err_duplicate_validator_t>([&] { reg.set_validators(admin, dup); }));
            reg.set_validators(admin, validators(0x20, 4));
            expect_equal(size_t { 4 }, reg.validators().size());
            expect(reg.contains(addr(0x23)));
            expect(!reg.contains(addr(0x0A)));
            reg.sync_validators(admin, validators(0x30, 6));
            expect_equal(size_t { 6 }, reg.validators().size());
            expect(throws<err_unauthorized_t>([&] { reg.sync_validators(addr(0x30), validators(0x40, 3)); }));
        };
        "from_config"_test = [&] {
            registry_config_t cfg {};
            cfg.admin = admin;
            cfg.min_jurors = 5;
            for (const auto &v: validators(0x0A, 7))
                cfg.validators.emplace_back(v);
            const auto reg = registry_t::from_config(cfg);
            expect_equal(uint32_t { 4 }, reg.quorum());
            cfg.quorum.emplace(3);
            expect_equal(uint32_t { 3 }, registry_t::from_config(cfg).quorum());
            for (const auto &v: validators(0x20, 100))
                cfg.validators.emplace_back(v);
            expect(throws<err_too_many_validators_t>([&] { registry_t::from_config(cfg); }));
        };
        "load"_test = [&] {
            file::tmp t { "verdict-registry-test.json" };
            const registry_t reg { admin, 3, 2, validators(0x0A, 5) };
            codec::json::save_pretty(t.path(), codec::json::to_json(reg.config()));
            const auto loaded = registry_t::load(t.path());
            expect_equal(reg.config(), loaded.config());
        };
    };
};
