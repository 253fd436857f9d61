// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>

#include <intx/intx.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/types/block.hpp>

namespace blockforge::payload::ethereum {

//! A sealed Ethereum payload and the fees it pays to the fee recipient
class EthBuiltPayload {
  public:
    EthBuiltPayload(PayloadId id, SealedBlock block, intx::uint256 fees)
        : id_{id}, block_{std::move(block)}, fees_{fees} {}

    PayloadId id() const { return id_; }
    const SealedBlock& block() const { return block_; }
    intx::uint256 fees() const { return fees_; }

    friend bool operator==(const EthBuiltPayload&, const EthBuiltPayload&) = default;

  private:
    PayloadId id_;
    SealedBlock block_;
    intx::uint256 fees_;
};

}  // namespace blockforge::payload::ethereum
