// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>

#include <intx/intx.hpp>

#include <blockforge/core/types/block.hpp>

namespace blockforge::payload {

//! A finalized payload: the sealed block and the total fees it pays to the fee recipient
template <class P>
concept BuiltPayload = std::copy_constructible<P> && requires(const P& payload) {
    { payload.block() } -> std::same_as<const SealedBlock&>;
    { payload.fees() } -> std::same_as<intx::uint256>;
};

}  // namespace blockforge::payload
