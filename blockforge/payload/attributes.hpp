// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <memory>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/common/bytes.hpp>
#include <blockforge/core/types/block.hpp>
#include <blockforge/core/types/hash.hpp>
#include <blockforge/core/types/withdrawal.hpp>
#include <blockforge/payload/either.hpp>

namespace blockforge::payload {

//! \brief Description of one requested block, validated once from raw engine API input and immutable afterwards
//! \details payload_id() must be a pure function of the identified fields: recomputing it from the same inputs
//! always yields the same id
template <class A>
concept PayloadAttributes = std::copy_constructible<A> &&
                            requires(const A& attributes, const Hash& parent, const RawAttributesOf<A>& raw) {
                                { A::try_new(parent, raw) } -> std::same_as<tl::expected<A, AttributesErrorOf<A>>>;
                                { attributes.payload_id() } -> std::same_as<PayloadId>;
                                { attributes.parent() } -> std::convertible_to<Hash>;
                                { attributes.timestamp() } -> std::same_as<BlockTime>;
                                { attributes.parent_beacon_block_root() } -> std::same_as<std::optional<evmc::bytes32>>;
                                { attributes.suggested_fee_recipient() } -> std::convertible_to<evmc::address>;
                                { attributes.prev_randao() } -> std::convertible_to<evmc::bytes32>;
                                { attributes.withdrawals() } -> std::same_as<const std::optional<std::vector<Withdrawal>>&>;
                            };

//! Static inputs of every build attempt for one payload
template <class A>
struct PayloadConfig {
    std::shared_ptr<const SealedHeader> parent_header;
    Bytes extra_data;
    A attributes;

    //! Hash of the parent block, taken from the attributes since the header may be absent
    Hash parent_hash() const { return Hash{attributes.parent()}; }
};

}  // namespace blockforge::payload
