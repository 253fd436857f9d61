// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <blockforge/core/common/bytes.hpp>
#include <blockforge/core/types/hash.hpp>

namespace blockforge {

//! EIP-4895 beacon chain withdrawal pushed into the execution layer
struct Withdrawal {
    uint64_t index{0};
    uint64_t validator_index{0};
    evmc::address address{};
    uint64_t amount{0};  // in GWei

    friend bool operator==(const Withdrawal&, const Withdrawal&) = default;
};

//! Commitment to an ordered withdrawal list: keccak256 of its RLP list encoding
Hash withdrawals_commitment(const std::vector<Withdrawal>& withdrawals);

namespace rlp {
    size_t length(const Withdrawal&);
    void encode(Bytes& to, const Withdrawal&);
    void encode(Bytes& to, const std::vector<Withdrawal>&);
}  // namespace rlp

}  // namespace blockforge
