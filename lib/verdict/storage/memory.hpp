#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "common.hpp"

namespace verdict::storage::memory {
    struct db_t: storage::db_t {
        explicit db_t();
        ~db_t() override;
        void clear() override;
        void erase(buffer key) override;
        void foreach(const observer_t &) const override;
        value_t get(buffer key) const override;
        void set(buffer key, buffer val) override;
        [[nodiscard]] size_t size() const override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
