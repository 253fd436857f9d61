// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "assert.hpp"

#include <cstdlib>
#include <iostream>

namespace blockforge {

void abort_due_to_assertion_failure(char const* expr, char const* file, int line) {
    std::cerr << "Assertion failed: " << expr << " at " << file << ":" << line << "\n";
    std::abort();
}

}  // namespace blockforge
