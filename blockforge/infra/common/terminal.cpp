// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <cstdio>

#include <unistd.h>

namespace blockforge {

void init_terminal() {
    // POSIX terminals understand escape sequences natively, only make sure stderr is unbuffered
    std::setvbuf(stderr, nullptr, _IONBF, 0);
}

bool is_terminal(int fd) {
    return isatty(fd) != 0;
}

bool is_terminal_stdout() {
    return is_terminal(fileno(stdout));
}

bool is_terminal_stderr() {
    return is_terminal(fileno(stderr));
}

}  // namespace blockforge
