/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/codec/binary.hpp>
#include <verdict/crypto/blake2b.hpp>
#include "mpc.hpp"

namespace verdict::court::mpc {
    hash_t computation_id(const case_id_t case_id, const timestamp_t timestamp)
    {
        const codec::binary::encoder enc { case_id, timestamp };
        return crypto::blake2b::digest<hash_t>({ config_base::mpc_domain, enc.bytes() });
    }

    mpc_session_t make_session(const case_id_t case_id, const size_t threshold, const size_t total_jurors, const timestamp_t timestamp)
    {
        if (threshold == 0 || threshold > total_jurors || total_jurors > config_base::mpc_max_jurors) [[unlikely]]
            throw err_invalid_threshold_t {};
        mpc_session_t session {};
        session.case_id = case_id;
        session.threshold = static_cast<uint8_t>(threshold);
        session.total_jurors = static_cast<uint8_t>(total_jurors);
        session.computation_id = computation_id(case_id, timestamp);
        session.state = mpc_state_t::initialized;
        session.created_at = timestamp;
        return session;
    }

    key_share_t add_share(mpc_session_t &session, const address_t &juror, const byte_array_t<32> &public_share,
        const hash_t &commitment, const timestamp_t timestamp)
    {
        if (session.state == mpc_state_t::complete) [[unlikely]]
            throw err_computation_complete_t {};
        if (session.shares_received >= session.total_jurors) [[unlikely]]
            throw err_all_shares_submitted_t {};
        key_share_t share {};
        share.juror = juror;
        share.case_id = session.case_id;
        share.share_index = session.shares_received;
        share.public_share = public_share;
        share.commitment = commitment;
        share.verified = false;
        share.timestamp = timestamp;
        ++session.shares_received;
        if (session.shares_received >= session.threshold)
            session.state = mpc_state_t::threshold_reached;
        else
            session.state = mpc_state_t::collecting_shares;
        return share;
    }

    bool add_partial(const mpc_session_t &session, aggregation_t &aggregation, const partial_decryption_t &partial)
    {
        if (session.state == mpc_state_t::complete || aggregation.final_result) [[unlikely]]
            throw err_computation_complete_t {};
        if (session.state != mpc_state_t::threshold_reached) [[unlikely]]
            throw err_threshold_not_reached_t {};
        if (aggregation.contains(partial.juror)) [[unlikely]]
            throw err_share_already_submitted_t {};
        if (aggregation.partial_decryptions.size() >= config_base::mpc_max_jurors) [[unlikely]]
            throw err_all_shares_submitted_t {};
        aggregation.partial_decryptions.emplace_back(partial);
        return aggregation.partial_decryptions.size() >= session.threshold;
    }

    void finalize(mpc_session_t &session, aggregation_t &aggregation, const vote_result_t &result)
    {
        if (aggregation.final_result) [[unlikely]]
            throw err_computation_complete_t {};
        if (aggregation.partial_decryptions.size() < session.threshold) [[unlikely]]
            throw err_threshold_not_reached_t {};
        aggregation.final_result.emplace(result);
        session.state = mpc_state_t::complete;
    }
}
