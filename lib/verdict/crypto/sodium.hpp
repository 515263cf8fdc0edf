#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdlib>
#include <verdict/common/error.hpp>

namespace verdict::crypto::sodium
{
    typedef verdict::error error;

    extern "C" {
#       include <sodium.h>
    }

    extern void ensure_initialized();
}
