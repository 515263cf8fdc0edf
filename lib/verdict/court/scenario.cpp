/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/codec/json.hpp>
#include <verdict/common/logger.hpp>
#include <verdict/storage/memory.hpp>
#include "ballot.hpp"
#include "scenario.hpp"

namespace verdict::court::scenario {
    void recording_freeze_t::freeze(const freeze_request_t &req)
    {
        if (fail) [[unlikely]]
            throw error(fmt::format("the freeze service refused case {}", req.case_id));
        requests.emplace_back(req);
    }

    fixed_combiner_t::fixed_combiner_t(const vote_result_t &result):
        _result { result }
    {
    }

    vote_result_t fixed_combiner_t::combine(const mpc_session_t &session, const aggregation_t &aggregation) const
    {
        logger::debug("fixed_combiner: combining {} partial decryptions for case {}", aggregation.partial_decryptions.size(), session.case_id);
        return _result;
    }

    namespace {
        using object = boost::json::object;

        template<typename T>
        std::optional<T> optional_field(const object &obj, const std::string_view name)
        {
            if (const auto it = obj.find(name); it != obj.end())
                return codec::json::from_json<T>(it->value());
            return {};
        }

        template<typename T>
        T field(const object &obj, const std::string_view name)
        {
            auto val = optional_field<T>(obj, name);
            if (!val) [[unlikely]]
                throw error(fmt::format("a required field '{}' is missing", name));
            return std::move(*val);
        }

        validator_list_t validator_list(const object &obj)
        {
            const auto list = field<sequence_t<address_t>>(obj, "validators");
            if (list.size() > config_base::max_validators) [[unlikely]]
                throw err_too_many_validators_t {};
            return { list.begin(), list.end() };
        }

        struct runner_t {
            runner_t(const boost::json::value &config, const object &scenario):
                _registry { registry_t::from_config(codec::json::from_json<registry_config_t>(config)) },
                _oracle { std::make_shared<randomness::memory_oracle_t>() },
                _freeze { std::make_shared<recording_freeze_t>() },
                _court { std::make_shared<storage::memory::db_t>(), _services(scenario) }
            {
                if (const auto it = scenario.find("oracle"); it != scenario.end()) {
                    for (const auto &acc: it->value().as_array())
                        _post(acc.as_object());
                }
                _freeze->fail = optional_field<bool>(scenario, "fail_freeze").value_or(false);
            }

            void run(const boost::json::array &steps)
            {
                for (const auto &jv: steps) {
                    const auto &step = jv.as_object();
                    const auto op = field<std::string>(step, "op");
                    const auto expected = optional_field<std::string>(step, "expect_error");
                    ++_report.steps;
                    std::optional<std::string> actual {};
                    try {
                        _apply(op, step);
                    } catch (const error &ex) {
                        if (!expected) [[unlikely]]
                            throw error(fmt::format("step #{} {} failed", _report.steps, op), ex);
                        actual.emplace(ex.what());
                    }
                    if (expected) {
                        if (actual != expected) [[unlikely]]
                            throw error(fmt::format("step #{} {}: expected {} but got {}", _report.steps, op, *expected,
                                actual ? std::string_view { *actual } : std::string_view { "success" }));
                        ++_report.expected_errors;
                        logger::debug("scenario: step #{} {} failed as expected with {}", _report.steps, op, *expected);
                    }
                }
            }

            void check(const object &expect) const
            {
                if (const auto it = expect.find("cases"); it != expect.end()) {
                    for (const auto &jv: it->value().as_array())
                        _check_case(jv.as_object());
                }
                if (const auto it = expect.find("freezes"); it != expect.end()) {
                    const auto exp = codec::json::from_json<sequence_t<case_id_t>>(it->value());
                    if (exp.size() != _freeze->requests.size()) [[unlikely]]
                        throw error(fmt::format("expected {} freeze requests but got {}", exp.size(), _freeze->requests.size()));
                    for (size_t i = 0; i < exp.size(); ++i) {
                        if (exp[i] != _freeze->requests[i].case_id) [[unlikely]]
                            throw error(fmt::format("freeze request #{} is for case {} but expected case {}", i, _freeze->requests[i].case_id, exp[i]));
                    }
                }
            }

            report_t report()
            {
                _report.cases = _court.cases();
                _report.freezes = _freeze->requests;
                return std::move(_report);
            }
        private:
            registry_t _registry;
            std::shared_ptr<randomness::memory_oracle_t> _oracle;
            std::shared_ptr<recording_freeze_t> _freeze;
            court_t _court;
            report_t _report {};

            services_t _services(const object &scenario) const
            {
                services_t svc {};
                svc.oracle = _oracle;
                svc.freeze = _freeze;
                if (const auto strategy = optional_field<std::string>(scenario, "strategy"); strategy)
                    svc.strategy = selection::make_strategy(*strategy);
                if (const auto result = optional_field<vote_result_t>(scenario, "combiner"); result)
                    svc.combiner = std::make_shared<fixed_combiner_t>(*result);
                // a deterministic clock so that replays are reproducible
                auto now = std::make_shared<timestamp_t>(optional_field<timestamp_t>(scenario, "start_time").value_or(1'700'000'000));
                svc.clock = [now] { return (*now)++; };
                return svc;
            }

            void _post(const object &acc)
            {
                _oracle->post(field<address_t>(acc, "account"), field<byte_sequence_t<>>(acc, "data"));
            }

            void _apply(const std::string_view op, const object &step)
            {
                if (op == "set_validators") {
                    _registry.set_validators(field<address_t>(step, "caller"), validator_list(step));
                } else if (op == "sync_validators") {
                    _registry.sync_validators(field<address_t>(step, "caller"), validator_list(step));
                } else if (op == "submit_case") {
                    _court.submit_case(field<address_t>(step, "reporter"), field<case_id_t>(step, "case_id"),
                        field<address_t>(step, "reported_address"), optional_field<byte_sequence_t<>>(step, "evidence").value_or(byte_sequence_t<> {}));
                } else if (op == "request_randomness") {
                    _court.request_randomness(field<case_id_t>(step, "case_id"), field<address_t>(step, "oracle_account"));
                } else if (op == "post_randomness") {
                    _post(step);
                } else if (op == "select_jurors") {
                    const auto case_id = field<case_id_t>(step, "case_id");
                    if (const auto acc = optional_field<address_t>(step, "oracle_account"); acc)
                        _court.select_jurors(case_id, _registry, *acc);
                    else
                        _court.select_jurors(case_id, _registry);
                } else if (op == "vote") {
                    _court.vote(field<case_id_t>(step, "case_id"), field<address_t>(step, "juror"), field<bool>(step, "approve"));
                } else if (op == "commit_vote") {
                    const auto case_id = field<case_id_t>(step, "case_id");
                    const auto commitment = optional_field<hash_t>(step, "commitment")
                        .value_or(ballot::commitment(field<bool>(step, "approve"), field<salt_t>(step, "salt")));
                    const auto nullifier = optional_field<hash_t>(step, "nullifier").value_or(ballot::nullifier(case_id, commitment));
                    auto proof = ballot::structural_proof(case_id, commitment);
                    if (const auto typ = optional_field<proof_type_t>(step, "proof_type"); typ)
                        proof.proof_type = *typ;
                    _court.commit_vote(case_id, field<address_t>(step, "juror"), commitment, nullifier, proof);
                } else if (op == "reveal_vote") {
                    _court.reveal_vote(field<case_id_t>(step, "case_id"), field<address_t>(step, "juror"),
                        field<bool>(step, "approve"), field<salt_t>(step, "salt"));
                } else if (op == "init_mpc") {
                    _court.init_mpc(field<case_id_t>(step, "case_id"), field<uint64_t>(step, "threshold"), field<uint64_t>(step, "total_jurors"));
                } else if (op == "submit_share") {
                    const auto public_share = field<byte_array_t<32>>(step, "public_share");
                    _court.submit_share(field<case_id_t>(step, "case_id"), field<address_t>(step, "juror"), public_share,
                        optional_field<hash_t>(step, "commitment").value_or(key_share_commitment(public_share)));
                } else if (op == "verify_share") {
                    _court.verify_share(field<case_id_t>(step, "case_id"), field<address_t>(step, "juror"));
                } else if (op == "submit_encrypted_tally") {
                    _court.submit_encrypted_tally(field<case_id_t>(step, "case_id"), field<byte_sequence_t<>>(step, "tally"));
                } else if (op == "submit_partial_decryption") {
                    _court.submit_partial_decryption(field<case_id_t>(step, "case_id"), field<address_t>(step, "juror"),
                        field<byte_array_t<32>>(step, "decryption_share"),
                        optional_field<byte_array_t<config_base::partial_proof_size>>(step, "proof").value_or(byte_array_t<config_base::partial_proof_size> {}));
                } else if (op == "apply_mpc_result") {
                    _court.apply_mpc_result(field<case_id_t>(step, "case_id"));
                } else {
                    throw error(fmt::format("unsupported scenario operation: {}", op));
                }
            }

            void _check_case(const object &exp) const
            {
                const auto case_id = field<case_id_t>(exp, "case_id");
                const auto c = _court.get_case(case_id);
                const auto check = [&](const std::string_view name, const auto &act) {
                    using T = std::decay_t<decltype(act)>;
                    if (const auto val = optional_field<T>(exp, name); val && !(*val == act)) [[unlikely]]
                        throw error(fmt::format("case {}: expected {} {} but got {}", case_id, name, *val, act));
                };
                check("status", c.status);
                check("phase", c.phase);
                check("votes_for", c.votes_for);
                check("votes_against", c.votes_against);
                check("jurors", c.jurors);
                check("voted", c.voted);
                check("quorum", c.quorum);
            }
        };
    }

    report_t replay(const boost::json::value &config, const boost::json::value &scenario)
    {
        const auto &obj = scenario.as_object();
        runner_t runner { config, obj };
        if (const auto it = obj.find("steps"); it != obj.end())
            runner.run(it->value().as_array());
        if (const auto it = obj.find("expect"); it != obj.end())
            runner.check(it->value().as_object());
        auto res = runner.report();
        logger::info("scenario: {} steps replayed, {} failed as expected, {} cases, {} freeze requests",
            res.steps, res.expected_errors, res.cases.size(), res.freezes.size());
        return res;
    }

    report_t replay_files(const std::string &config_path, const std::string &scenario_path)
    {
        return replay(codec::json::load(config_path), codec::json::load(scenario_path));
    }
}
