#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <vector>
#include "common.hpp"

namespace verdict::storage::update {
    // Buffers writes over a base database until commit is called.
    // Dropping an uncommitted instance leaves the base database untouched.
    // N.B. this class is not thread safe!
    struct db_t final: storage::db_t {
        using update_map_t = std::map<uint8_vector, value_t>;
        using undo_list_t = std::vector<std::pair<uint8_vector, value_t>>;

        db_t() = delete;

        explicit db_t(storage::db_ptr_t db):
            _base_db { std::move(db) }
        {
            if (!_base_db) [[unlikely]]
                throw error("update::db_t requires a base database");
        }

        ~db_t() override = default;

        void clear() override
        {
            throw error("clear is not supported for update::db_t!");
        }

        void erase(const buffer key) override
        {
            _set(key, {});
        }

        void foreach(const observer_t &obs) const override;

        value_t get(const buffer k) const override
        {
            if (const auto it = _updates.find(uint8_vector { k }); it != _updates.end())
                return it->second;
            return _base_db->get(k);
        }

        void set(const buffer key, const buffer val) override
        {
            _set(key, uint8_vector { val });
        }

        [[nodiscard]] size_t size() const override
        {
            return _base_db->size() + _num_added - _num_removed;
        }

        // Applies the buffered updates to the base database.
        // If the base database throws midway, the already applied updates are reverted.
        void commit();

        void reset()
        {
            _updates.clear();
            _num_added = 0;
            _num_removed = 0;
        }

        [[nodiscard]] const update_map_t &updates() const noexcept
        {
            return _updates;
        }
    private:
        storage::db_ptr_t _base_db;
        update_map_t _updates {};
        size_t _num_added = 0;
        size_t _num_removed = 0;

        void _set(buffer key, value_t val);
    };
}
