/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <verdict/codec/binary.hpp>
#include <verdict/common/logger.hpp>
#include <verdict/storage/update.hpp>
#include "ballot.hpp"
#include "case.hpp"
#include "court.hpp"
#include "mpc.hpp"

namespace verdict::court {
    timestamp_t system_clock_now()
    {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    }

    namespace keys {
        uint8_vector make(const prefix_t prefix, const case_id_t case_id)
        {
            codec::binary::encoder enc { static_cast<uint8_t>(prefix), case_id };
            return std::move(enc.bytes());
        }

        uint8_vector make(const prefix_t prefix, const case_id_t case_id, const byte_array<32> &suffix)
        {
            auto key = make(prefix, case_id);
            key << suffix;
            return key;
        }
    }

    struct court_t::impl {
        impl(storage::db_ptr_t db, services_t services):
            _db { std::move(db) },
            _svc { std::move(services) }
        {
            if (!_db) [[unlikely]]
                throw error("court: a storage backend is required");
            if (!_svc.oracle || !_svc.freeze || !_svc.verifier || !_svc.strategy || !_svc.clock) [[unlikely]]
                throw error("court: the oracle, freeze service, verifier, selection strategy and clock are required");
        }

        void submit_case(const address_t &reporter, const case_id_t case_id, const address_t &reported_address, const buffer evidence)
        {
            _transact("submit_case", case_id, [&](storage::db_t &db) {
                if (evidence.size() > config_base::max_evidence_size) [[unlikely]]
                    throw err_evidence_too_large_t {};
                if (_load<case_t>(db, keys::make(keys::prefix_t::case_record, case_id))) [[unlikely]]
                    throw err_case_already_exists_t {};
                case_t c {};
                c.case_id = case_id;
                c.reporter = reporter;
                c.reported_address = reported_address;
                c.evidence.assign(evidence.begin(), evidence.end());
                c.created_at = _svc.clock();
                _save_case(db, c);
                logger::info("court: case {} opened against {} by {}", case_id, reported_address, reporter);
            });
        }

        void request_randomness(const case_id_t case_id, const address_t &oracle_account)
        {
            _transact("request_randomness", case_id, [&](storage::db_t &db) {
                auto c = _load_case(db, case_id);
                if (c.status != case_status_t::open) [[unlikely]]
                    throw err_case_not_open_t {};
                if (c.phase != case_phase_t::pending_jurors) [[unlikely]]
                    throw err_invalid_case_t {};
                c.randomness.emplace(oracle_account);
                _save_case(db, c);
                logger::info("court: case {} awaits randomness from {}", case_id, oracle_account);
            });
        }

        void select_jurors(const case_id_t case_id, const registry_t &registry, const address_t *oracle_account)
        {
            _transact("select_jurors", case_id, [&](storage::db_t &db) {
                auto c = _load_case(db, case_id);
                if (c.phase != case_phase_t::pending_jurors || c.terminal()) [[unlikely]]
                    throw err_invalid_case_t {};
                if (!c.randomness) [[unlikely]]
                    throw err_vrf_not_ready_t {};
                if (oracle_account && *oracle_account != *c.randomness) [[unlikely]]
                    throw err_invalid_randomness_t {};
                const auto seed = randomness::extract_seed(*_svc.oracle, *c.randomness);
                const auto &validators = registry.validators();
                const size_t num_jurors = registry.min_jurors();
                if (validators.size() < num_jurors) [[unlikely]]
                    throw err_not_enough_validators_t {};
                const auto indices = _svc.strategy->select(seed, validators.size(), num_jurors);
                juror_set_t jurors {};
                jurors.reserve(num_jurors);
                for (const auto idx: indices) {
                    if (idx >= validators.size() || !jurors.emplace(validators[idx]).second) [[unlikely]] {
                        logger::warn("court: strategy {} returned an unusable index {} for case {}", _svc.strategy->name(), idx, case_id);
                        throw err_juror_selection_failed_t {};
                    }
                }
                if (jurors.size() != num_jurors) [[unlikely]]
                    throw err_juror_selection_failed_t {};
                c.juror_candidates = validators;
                c.jurors = std::move(jurors);
                c.quorum = registry.quorum();
                c.phase = case_phase_t::voting;
                _save_case(db, c);
                logger::info("court: case {} selected jurors with {}: {}", case_id, _svc.strategy->name(), c.jurors);
            });
        }

        void vote(const case_id_t case_id, const address_t &juror, const bool approve)
        {
            _transact("vote", case_id, [&](storage::db_t &db) {
                auto c = _load_case(db, case_id);
                record_vote(c, juror, approve);
                logger::debug("court: case {} juror {} voted {}", case_id, juror, approve ? "for" : "against");
                _decide(db, c);
            });
        }

        void commit_vote(const case_id_t case_id, const address_t &juror, const hash_t &commitment, const hash_t &nullifier, const proof_t &proof)
        {
            _transact("commit_vote", case_id, [&](storage::db_t &db) {
                const auto c = _load_case(db, case_id);
                if (c.phase != case_phase_t::voting || c.terminal()) [[unlikely]]
                    throw err_case_not_voting_t {};
                if (c.jurors.find(juror) == c.jurors.end()) [[unlikely]]
                    throw err_not_juror_t {};
                const auto rec_key = keys::make(keys::prefix_t::commitment, case_id, juror);
                if (c.voted.find(juror) != c.voted.end() || _load<vote_commitment_t>(db, rec_key)) [[unlikely]]
                    throw err_already_voted_t {};
                if (proof.proof_type != proof_type_t::vote_commitment) [[unlikely]]
                    throw err_invalid_proof_type_t {};
                if (nullifier != ballot::nullifier(case_id, commitment)) [[unlikely]]
                    throw err_invalid_zk_proof_t {};
                if (!_svc.verifier->verify_vote_proof(case_id, commitment, nullifier, proof)) [[unlikely]]
                    throw err_invalid_zk_proof_t {};
                const auto nf_key = keys::make(keys::prefix_t::nullifier, case_id, nullifier);
                if (db.get(nf_key)) [[unlikely]]
                    throw err_nullifier_already_used_t {};
                db.set(nf_key, juror);
                _save(db, rec_key, ballot::make_record(case_id, juror, commitment, nullifier, _svc.clock()));
                logger::info("court: case {} received a vote commitment from {}", case_id, juror);
            });
        }

        void reveal_vote(const case_id_t case_id, const address_t &juror, const bool approve, const salt_t &salt)
        {
            _transact("reveal_vote", case_id, [&](storage::db_t &db) {
                auto c = _load_case(db, case_id);
                if (c.phase != case_phase_t::voting || c.terminal()) [[unlikely]]
                    throw err_case_not_voting_t {};
                const auto rec_key = keys::make(keys::prefix_t::commitment, case_id, juror);
                auto rec = _load<vote_commitment_t>(db, rec_key);
                if (!rec) [[unlikely]]
                    throw err_invalid_reveal_t {};
                ballot::reveal(*rec, approve, salt);
                record_vote(c, juror, approve);
                _save(db, rec_key, *rec);
                logger::info("court: case {} juror {} revealed a vote", case_id, juror);
                _decide(db, c);
            });
        }

        void init_mpc(const case_id_t case_id, const size_t threshold, const size_t total_jurors)
        {
            _transact("init_mpc", case_id, [&](storage::db_t &db) {
                _load_case(db, case_id);
                const auto session_key = keys::make(keys::prefix_t::mpc_session, case_id);
                if (db.get(session_key)) [[unlikely]]
                    throw err_mpc_already_initialized_t {};
                const auto session = mpc::make_session(case_id, threshold, total_jurors, _svc.clock());
                aggregation_t agg {};
                agg.case_id = case_id;
                _save(db, session_key, session);
                _save(db, keys::make(keys::prefix_t::aggregation, case_id), agg);
                logger::info("court: case {} MPC session {} initialized threshold: {}/{}", case_id, session.computation_id, threshold, total_jurors);
            });
        }

        void submit_share(const case_id_t case_id, const address_t &juror, const byte_array_t<32> &public_share, const hash_t &commitment)
        {
            _transact("submit_share", case_id, [&](storage::db_t &db) {
                auto session = _load_session(db, case_id);
                const auto c = _load_case(db, case_id);
                if (c.jurors.find(juror) == c.jurors.end()) [[unlikely]]
                    throw err_not_juror_t {};
                const auto share_key = keys::make(keys::prefix_t::key_share, case_id, juror);
                if (db.get(share_key)) [[unlikely]]
                    throw err_share_already_submitted_t {};
                const auto prev_state = session.state;
                const auto share = mpc::add_share(session, juror, public_share, commitment, _svc.clock());
                _save(db, share_key, share);
                _save(db, keys::make(keys::prefix_t::mpc_session, case_id), session);
                logger::info("court: case {} MPC share #{} from {} progress: {}/{}", case_id, share.share_index, juror,
                    session.shares_received, session.total_jurors);
                if (prev_state != session.state)
                    logger::info("court: case {} MPC session state: {} -> {}", case_id, prev_state, session.state);
            });
        }

        void verify_share(const case_id_t case_id, const address_t &juror)
        {
            _transact("verify_share", case_id, [&](storage::db_t &db) {
                _load_session(db, case_id);
                const auto share_key = keys::make(keys::prefix_t::key_share, case_id, juror);
                auto share = _load<key_share_t>(db, share_key);
                if (!share) [[unlikely]]
                    throw err_share_not_verified_t {};
                if (share->verified)
                    return;
                if (!_svc.verifier->verify_key_share(*share)) [[unlikely]]
                    throw err_invalid_zk_proof_t {};
                share->verified = true;
                _save(db, share_key, *share);
                logger::info("court: case {} MPC share of {} verified", case_id, juror);
            });
        }

        void submit_encrypted_tally(const case_id_t case_id, const buffer encrypted_tally)
        {
            _transact("submit_encrypted_tally", case_id, [&](storage::db_t &db) {
                _load_session(db, case_id);
                const auto agg_key = keys::make(keys::prefix_t::aggregation, case_id);
                auto agg = _load_aggregation(db, case_id);
                if (agg.final_result) [[unlikely]]
                    throw err_computation_complete_t {};
                if (encrypted_tally.size() > config_base::max_encrypted_tally_size) [[unlikely]]
                    throw error(fmt::format("an encrypted tally of {} bytes exceeds the limit of {} bytes",
                        encrypted_tally.size(), config_base::max_encrypted_tally_size));
                agg.encrypted_tally.emplace();
                agg.encrypted_tally->assign(encrypted_tally.begin(), encrypted_tally.end());
                _save(db, agg_key, agg);
                logger::info("court: case {} received an encrypted tally of {} bytes", case_id, encrypted_tally.size());
            });
        }

        void submit_partial_decryption(const case_id_t case_id, const address_t &juror, const byte_array_t<32> &decryption_share,
            const byte_array_t<config_base::partial_proof_size> &proof)
        {
            _transact("submit_partial_decryption", case_id, [&](storage::db_t &db) {
                auto session = _load_session(db, case_id);
                const auto share = _load<key_share_t>(db, keys::make(keys::prefix_t::key_share, case_id, juror));
                if (!share || !share->verified) [[unlikely]]
                    throw err_share_not_verified_t {};
                auto agg = _load_aggregation(db, case_id);
                partial_decryption_t partial {};
                partial.juror = juror;
                partial.decryption_share = decryption_share;
                partial.proof = proof;
                if (mpc::add_partial(session, agg, partial)) {
                    if (!_svc.combiner) [[unlikely]]
                        throw error("court: no MPC combiner is configured");
                    const auto result = _svc.combiner->combine(session, agg);
                    mpc::finalize(session, agg, result);
                    logger::info("court: case {} MPC computation {} complete: {}", case_id, session.computation_id, result);
                }
                _save(db, keys::make(keys::prefix_t::mpc_session, case_id), session);
                _save(db, keys::make(keys::prefix_t::aggregation, case_id), agg);
                logger::debug("court: case {} partial decryption from {} accepted", case_id, juror);
            });
        }

        void apply_mpc_result(const case_id_t case_id)
        {
            _transact("apply_mpc_result", case_id, [&](storage::db_t &db) {
                auto c = _load_case(db, case_id);
                if (c.phase != case_phase_t::voting || c.terminal()) [[unlikely]]
                    throw err_case_not_voting_t {};
                auto agg = _load_aggregation(db, case_id);
                if (!agg.final_result) [[unlikely]]
                    throw err_threshold_not_reached_t {};
                const auto &res = *agg.final_result;
                if (agg.applied || !c.voted.empty() || c.votes_for != 0 || c.votes_against != 0) [[unlikely]]
                    throw err_already_voted_t {};
                if (!res.verified) [[unlikely]]
                    throw err_invalid_zk_proof_t {};
                if (res.votes_for > c.jurors.size() || res.votes_against > c.jurors.size()
                        || res.votes_for + res.votes_against > c.jurors.size()) [[unlikely]]
                    throw err_arithmetic_overflow_t {};
                c.votes_for = res.votes_for;
                c.votes_against = res.votes_against;
                // the tally closes the ballot for every juror
                c.voted = c.jurors;
                agg.applied = true;
                _save(db, keys::make(keys::prefix_t::aggregation, case_id), agg);
                _decide(db, c, true);
            });
        }

        std::optional<case_t> find_case(const case_id_t case_id) const
        {
            return _load<case_t>(*_db, keys::make(keys::prefix_t::case_record, case_id));
        }

        case_t get_case(const case_id_t case_id) const
        {
            return _load_case(*_db, case_id);
        }

        std::optional<vote_commitment_t> get_commitment(const case_id_t case_id, const address_t &juror) const
        {
            return _load<vote_commitment_t>(*_db, keys::make(keys::prefix_t::commitment, case_id, juror));
        }

        std::optional<mpc_session_t> get_mpc_session(const case_id_t case_id) const
        {
            return _load<mpc_session_t>(*_db, keys::make(keys::prefix_t::mpc_session, case_id));
        }

        std::optional<key_share_t> get_key_share(const case_id_t case_id, const address_t &juror) const
        {
            return _load<key_share_t>(*_db, keys::make(keys::prefix_t::key_share, case_id, juror));
        }

        std::optional<aggregation_t> get_aggregation(const case_id_t case_id) const
        {
            return _load<aggregation_t>(*_db, keys::make(keys::prefix_t::aggregation, case_id));
        }

        std::vector<case_t> cases() const
        {
            static constexpr size_t case_key_size = 1 + sizeof(case_id_t);
            std::vector<case_t> res {};
            _db->foreach([&](const auto &k, const auto &v) {
                if (k.size() == case_key_size && k[0] == static_cast<uint8_t>(keys::prefix_t::case_record))
                    res.emplace_back(codec::binary::decode<case_t>(v));
            });
            return res;
        }
    private:
        storage::db_ptr_t _db;
        services_t _svc;

        template<typename T>
        static std::optional<T> _load(const storage::db_t &db, const buffer key)
        {
            if (const auto bytes = db.get(key); bytes)
                return codec::binary::decode<T>(*bytes);
            return {};
        }

        template<typename T>
        static void _save(storage::db_t &db, const buffer key, const T &val)
        {
            db.set(key, codec::binary::encode(val));
        }

        static case_t _load_case(const storage::db_t &db, const case_id_t case_id)
        {
            auto c = _load<case_t>(db, keys::make(keys::prefix_t::case_record, case_id));
            if (!c) [[unlikely]]
                throw err_invalid_case_t {};
            return std::move(*c);
        }

        static void _save_case(storage::db_t &db, const case_t &c)
        {
            _save(db, keys::make(keys::prefix_t::case_record, c.case_id), c);
        }

        static mpc_session_t _load_session(const storage::db_t &db, const case_id_t case_id)
        {
            auto session = _load<mpc_session_t>(db, keys::make(keys::prefix_t::mpc_session, case_id));
            if (!session) [[unlikely]]
                throw err_mpc_not_initialized_t {};
            return *session;
        }

        static aggregation_t _load_aggregation(const storage::db_t &db, const case_id_t case_id)
        {
            auto agg = _load<aggregation_t>(db, keys::make(keys::prefix_t::aggregation, case_id));
            if (!agg) [[unlikely]]
                throw err_mpc_not_initialized_t {};
            return std::move(*agg);
        }

        // Evaluates the quorum, hands an approval by quorum to the freeze service and stores the case.
        // The freeze service is called before anything is committed, so its failure aborts the whole operation.
        void _decide(storage::db_t &db, case_t &c, const bool final_tally=false)
        {
            const auto outcome = evaluate_votes(c, final_tally);
            switch (outcome) {
                case outcome_t::pending:
                    break;
                case outcome_t::approved_by_quorum:
                    logger::info("court: case {} approved by quorum {}/{} freezing {}", c.case_id, c.votes_for, c.quorum, c.reported_address);
                    _svc.freeze->freeze(freeze_request_t { c.case_id, c.reported_address, c.phase });
                    break;
                case outcome_t::approved_by_majority:
                case outcome_t::rejected:
                    logger::info("court: case {} closed as {} with {} for and {} against", c.case_id, c.phase, c.votes_for, c.votes_against);
                    break;
            }
            _save_case(db, c);
        }

        template<typename F>
        void _transact(const std::string_view op, const case_id_t case_id, const F &action)
        {
            storage::update::db_t txn { _db };
            try {
                action(txn);
            } catch (const error &ex) {
                logger::debug("court: {} on case {} rejected: {}", op, case_id, ex.what());
                throw;
            }
            txn.commit();
        }
    };

    court_t::court_t(storage::db_ptr_t db, services_t services):
        _impl { std::make_unique<impl>(std::move(db), std::move(services)) }
    {
    }

    court_t::~court_t() = default;

    void court_t::submit_case(const address_t &reporter, const case_id_t case_id, const address_t &reported_address, const buffer evidence)
    {
        _impl->submit_case(reporter, case_id, reported_address, evidence);
    }

    void court_t::request_randomness(const case_id_t case_id, const address_t &oracle_account)
    {
        _impl->request_randomness(case_id, oracle_account);
    }

    void court_t::select_jurors(const case_id_t case_id, const registry_t &registry)
    {
        _impl->select_jurors(case_id, registry, nullptr);
    }

    void court_t::select_jurors(const case_id_t case_id, const registry_t &registry, const address_t &oracle_account)
    {
        _impl->select_jurors(case_id, registry, &oracle_account);
    }

    void court_t::vote(const case_id_t case_id, const address_t &juror, const bool approve)
    {
        _impl->vote(case_id, juror, approve);
    }

    void court_t::commit_vote(const case_id_t case_id, const address_t &juror, const hash_t &commitment, const hash_t &nullifier, const proof_t &proof)
    {
        _impl->commit_vote(case_id, juror, commitment, nullifier, proof);
    }

    void court_t::reveal_vote(const case_id_t case_id, const address_t &juror, const bool approve, const salt_t &salt)
    {
        _impl->reveal_vote(case_id, juror, approve, salt);
    }

    void court_t::init_mpc(const case_id_t case_id, const size_t threshold, const size_t total_jurors)
    {
        _impl->init_mpc(case_id, threshold, total_jurors);
    }

    void court_t::submit_share(const case_id_t case_id, const address_t &juror, const byte_array_t<32> &public_share, const hash_t &commitment)
    {
        _impl->submit_share(case_id, juror, public_share, commitment);
    }

    void court_t::verify_share(const case_id_t case_id, const address_t &juror)
    {
        _impl->verify_share(case_id, juror);
    }

    void court_t::submit_encrypted_tally(const case_id_t case_id, const buffer encrypted_tally)
    {
        _impl->submit_encrypted_tally(case_id, encrypted_tally);
    }

    void court_t::submit_partial_decryption(const case_id_t case_id, const address_t &juror, const byte_array_t<32> &decryption_share,
        const byte_array_t<config_base::partial_proof_size> &proof)
    {
        _impl->submit_partial_decryption(case_id, juror, decryption_share, proof);
    }

    void court_t::apply_mpc_result(const case_id_t case_id)
    {
        _impl->apply_mpc_result(case_id);
    }

    case_t court_t::get_case(const case_id_t case_id) const
    {
        return _impl->get_case(case_id);
    }

    std::optional<case_t> court_t::find_case(const case_id_t case_id) const
    {
        return _impl->find_case(case_id);
    }

    std::optional<vote_commitment_t> court_t::get_commitment(const case_id_t case_id, const address_t &juror) const
    {
        return _impl->get_commitment(case_id, juror);
    }

    std::optional<mpc_session_t> court_t::get_mpc_session(const case_id_t case_id) const
    {
        return _impl->get_mpc_session(case_id);
    }

    std::optional<key_share_t> court_t::get_key_share(const case_id_t case_id, const address_t &juror) const
    {
        return _impl->get_key_share(case_id, juror);
    }

    std::optional<aggregation_t> court_t::get_aggregation(const case_id_t case_id) const
    {
        return _impl->get_aggregation(case_id);
    }

    std::vector<case_t> court_t::cases() const
    {
        return _impl->cases();
    }
}
