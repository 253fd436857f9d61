// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "attributes.hpp"

#include <utility>

#include <blockforge/payload/payload_id.hpp>

namespace blockforge::payload::ethereum {

tl::expected<void, AttributesError> validate_attributes(const RawPayloadAttributes& raw) {
    using Code = AttributesError::Code;
    if (raw.timestamp == 0) {
        return tl::unexpected{AttributesError{Code::kInvalidTimestamp, "timestamp must be positive"}};
    }
    switch (raw.version) {
        case EngineApiVersion::kV1:
            if (raw.withdrawals) {
                return tl::unexpected{AttributesError{Code::kUnexpectedWithdrawals, "withdrawals before V2"}};
            }
            if (raw.parent_beacon_block_root) {
                return tl::unexpected{AttributesError{Code::kUnexpectedParentBeaconBlockRoot, "beacon root before V3"}};
            }
            break;
        case EngineApiVersion::kV2:
            if (!raw.withdrawals) {
                return tl::unexpected{AttributesError{Code::kMissingWithdrawals, "withdrawals required since V2"}};
            }
            if (raw.parent_beacon_block_root) {
                return tl::unexpected{AttributesError{Code::kUnexpectedParentBeaconBlockRoot, "beacon root before V3"}};
            }
            break;
        case EngineApiVersion::kV3:
            if (!raw.withdrawals) {
                return tl::unexpected{AttributesError{Code::kMissingWithdrawals, "withdrawals required since V2"}};
            }
            if (!raw.parent_beacon_block_root) {
                return tl::unexpected{
                    AttributesError{Code::kMissingParentBeaconBlockRoot, "parent beacon block root required since V3"}};
            }
            break;
    }
    return {};
}

tl::expected<EthPayloadAttributes, AttributesError> EthPayloadAttributes::try_new(const Hash& parent,
                                                                                  const RawPayloadAttributes& raw) {
    if (auto valid{validate_attributes(raw)}; !valid) {
        return tl::unexpected{std::move(valid.error())};
    }
    return EthPayloadAttributes{parent, raw};
}

EthPayloadAttributes::EthPayloadAttributes(const Hash& parent, RawPayloadAttributes fields)
    : parent_{parent}, fields_{std::move(fields)} {
    id_ = PayloadIdHasher{parent_, fields_.timestamp, fields_.prev_randao, fields_.suggested_fee_recipient}
              .withdrawals(fields_.withdrawals)
              .parent_beacon_block_root(fields_.parent_beacon_block_root)
              .finalize();
}

}  // namespace blockforge::payload::ethereum
