// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace blockforge {
[[noreturn]] void abort_due_to_assertion_failure(char const* expr, char const* file, int line);
}

// BLOCKFORGE_ASSERT always aborts program execution on assertion failure, even when NDEBUG is defined.
#define BLOCKFORGE_ASSERT(expr) \
    if ((expr)) [[likely]]      \
        static_cast<void>(0);   \
    else                        \
        ::blockforge::abort_due_to_assertion_failure(#expr, __FILE__, __LINE__)
