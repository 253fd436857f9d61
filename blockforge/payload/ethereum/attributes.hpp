// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/types/hash.hpp>
#include <blockforge/core/types/withdrawal.hpp>
#include <blockforge/payload/errors.hpp>

namespace blockforge::payload::ethereum {

//! Engine API method version the attributes came with, fixing which optional fields are mandatory
enum class EngineApiVersion : uint8_t {
    kV1 = 1,  // Paris
    kV2 = 2,  // Shanghai: withdrawals
    kV3 = 3,  // Cancun: parent beacon block root
};

//! Engine API PayloadAttributes as received from the consensus layer
struct RawPayloadAttributes {
    EngineApiVersion version{EngineApiVersion::kV3};
    BlockTime timestamp{0};
    evmc::bytes32 prev_randao{};
    evmc::address suggested_fee_recipient{};
    std::optional<std::vector<Withdrawal>> withdrawals;
    std::optional<evmc::bytes32> parent_beacon_block_root;

    friend bool operator==(const RawPayloadAttributes&, const RawPayloadAttributes&) = default;
};

//! Validated attributes of the default Ethereum payload builder
class EthPayloadAttributes {
  public:
    using RawAttributes = RawPayloadAttributes;
    using Error = AttributesError;

    //! Validate raw attributes against their engine API version and derive the payload id
    static tl::expected<EthPayloadAttributes, AttributesError> try_new(const Hash& parent, const RawPayloadAttributes& raw);

    PayloadId payload_id() const { return id_; }
    const Hash& parent() const { return parent_; }
    BlockTime timestamp() const { return fields_.timestamp; }
    std::optional<evmc::bytes32> parent_beacon_block_root() const { return fields_.parent_beacon_block_root; }
    const evmc::address& suggested_fee_recipient() const { return fields_.suggested_fee_recipient; }
    const evmc::bytes32& prev_randao() const { return fields_.prev_randao; }
    const std::optional<std::vector<Withdrawal>>& withdrawals() const { return fields_.withdrawals; }

    const RawPayloadAttributes& raw() const { return fields_; }

    friend bool operator==(const EthPayloadAttributes&, const EthPayloadAttributes&) = default;

  private:
    EthPayloadAttributes(const Hash& parent, RawPayloadAttributes fields);

    Hash parent_;
    RawPayloadAttributes fields_;
    PayloadId id_{0};
};

//! \brief Check the fields every engine API version agrees on plus the version-specific optional fields
//! \remarks shared with attribute variants extending the Ethereum ones
tl::expected<void, AttributesError> validate_attributes(const RawPayloadAttributes& raw);

}  // namespace blockforge::payload::ethereum
