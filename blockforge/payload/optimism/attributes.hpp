// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/common/bytes.hpp>
#include <blockforge/core/types/hash.hpp>
#include <blockforge/core/types/transaction.hpp>
#include <blockforge/core/types/withdrawal.hpp>
#include <blockforge/payload/errors.hpp>
#include <blockforge/payload/ethereum/attributes.hpp>

namespace blockforge::payload::optimism {

//! Rollup engine API payload attributes: the Ethereum ones plus the sequencer inputs
struct RawOpPayloadAttributes {
    ethereum::RawPayloadAttributes payload_attributes;
    //! EIP-2718 envelopes the sequencer forces at the top of the block
    std::optional<std::vector<Bytes>> transactions;
    //! If set, the block contains the forced transactions only
    bool no_tx_pool{false};
    std::optional<uint64_t> gas_limit;

    friend bool operator==(const RawOpPayloadAttributes&, const RawOpPayloadAttributes&) = default;
};

//! Validated attributes of the sequencer-aware rollup payload builder
class OpPayloadAttributes {
  public:
    using RawAttributes = RawOpPayloadAttributes;
    using Error = AttributesError;

    //! \brief Validate the Ethereum fields, require the gas limit and decode every sequencer transaction
    //! \remarks the first undecodable sequencer transaction rejects the whole attributes
    static tl::expected<OpPayloadAttributes, AttributesError> try_new(const Hash& parent,
                                                                      const RawOpPayloadAttributes& raw);

    PayloadId payload_id() const { return id_; }
    const Hash& parent() const { return parent_; }
    BlockTime timestamp() const { return fields_.timestamp; }
    std::optional<evmc::bytes32> parent_beacon_block_root() const { return fields_.parent_beacon_block_root; }
    const evmc::address& suggested_fee_recipient() const { return fields_.suggested_fee_recipient; }
    const evmc::bytes32& prev_randao() const { return fields_.prev_randao; }
    const std::optional<std::vector<Withdrawal>>& withdrawals() const { return fields_.withdrawals; }

    const std::vector<RecoveredTransaction>& sequencer_transactions() const { return sequencer_transactions_; }
    bool no_tx_pool() const { return no_tx_pool_; }
    uint64_t gas_limit() const { return gas_limit_; }

    friend bool operator==(const OpPayloadAttributes&, const OpPayloadAttributes&) = default;

  private:
    OpPayloadAttributes(const Hash& parent, const RawOpPayloadAttributes& raw,
                        std::vector<RecoveredTransaction> sequencer_transactions);

    Hash parent_;
    ethereum::RawPayloadAttributes fields_;
    std::vector<RecoveredTransaction> sequencer_transactions_;
    bool no_tx_pool_{false};
    uint64_t gas_limit_{0};
    PayloadId id_{0};
};

}  // namespace blockforge::payload::optimism
