// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>

#include <intx/intx.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/types/block.hpp>

namespace blockforge::payload::optimism {

//! A sealed rollup payload; its first sequencer_transaction_count transactions are the forced ones
class OpBuiltPayload {
  public:
    OpBuiltPayload(PayloadId id, SealedBlock block, intx::uint256 fees, size_t sequencer_transaction_count)
        : id_{id}, block_{std::move(block)}, fees_{fees}, sequencer_transaction_count_{sequencer_transaction_count} {}

    PayloadId id() const { return id_; }
    const SealedBlock& block() const { return block_; }
    intx::uint256 fees() const { return fees_; }
    size_t sequencer_transaction_count() const { return sequencer_transaction_count_; }

    friend bool operator==(const OpBuiltPayload&, const OpBuiltPayload&) = default;

  private:
    PayloadId id_;
    SealedBlock block_;
    intx::uint256 fees_;
    size_t sequencer_transaction_count_;
};

}  // namespace blockforge::payload::optimism
