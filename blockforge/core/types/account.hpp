// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

namespace blockforge {

using namespace evmc::literals;

// Keccak-256 of the empty string, i.e. the code hash of externally owned accounts
inline constexpr evmc::bytes32 kEmptyHash{0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32};

//! The account fields a payload builder reads from state
struct AccountInfo {
    uint64_t nonce{0};
    intx::uint256 balance;
    evmc::bytes32 code_hash{kEmptyHash};

    friend bool operator==(const AccountInfo&, const AccountInfo&) = default;
};

}  // namespace blockforge
