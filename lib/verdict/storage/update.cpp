/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <verdict/common/logger.hpp>
#include "update.hpp"

namespace verdict::storage::update {
    void db_t::foreach(const observer_t &obs) const
    {
        auto upd_it = _updates.begin();
        const auto upd_end = _updates.end();
        _base_db->foreach([&](const auto &k, const auto &v) {
            while (upd_it != upd_end && upd_it->first < k) {
                if (upd_it->second)
                    obs(upd_it->first, *upd_it->second);
                ++upd_it;
            }
            if (upd_it != upd_end && upd_it->first == k) {
                if (upd_it->second)
                    obs(k, *upd_it->second);
                ++upd_it;
            } else {
                obs(k, v);
            }
        });
        for (; upd_it != upd_end; ++upd_it) {
            if (upd_it->second)
                obs(upd_it->first, *upd_it->second);
        }
    }

    void db_t::commit()
    {
        undo_list_t undo {};
        undo.reserve(_updates.size());
        try {
            for (const auto &[k, v]: _updates) {
                auto prev_v = _base_db->get(k);
                undo.emplace_back(k, std::move(prev_v));
                if (v)
                    _base_db->set(k, *v);
                else
                    _base_db->erase(k);
            }
        } catch (const std::exception &ex) {
            logger::warn("storage::update::db: commit failed after {} of {} updates: {}", undo.size(), _updates.size(), ex.what());
            for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
                if (it->second)
                    _base_db->set(it->first, *it->second);
                else
                    _base_db->erase(it->first);
            }
            throw;
        }
        reset();
    }

    void db_t::_set(const buffer key, value_t val)
    {
        logger::trace("storage::update::db: key {} set to: {}", key, val);
        const auto parent_val = _base_db->get(key);
        const auto track = [&](const value_t &v, const bool add) {
            auto &cnt = v ? _num_added : _num_removed;
            if (static_cast<bool>(v) != static_cast<bool>(parent_val))
                add ? ++cnt : --cnt;
        };
        const uint8_vector k { key };
        if (const auto it = _updates.find(k); it != _updates.end()) {
            track(it->second, false);
            _updates.erase(it);
        }
        if (parent_val != val) {
            track(val, true);
            _updates.emplace(k, std::move(val));
        }
    }
}
