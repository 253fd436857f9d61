// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

#include <blockforge/chain/chain_client.hpp>
#include <blockforge/chain/transaction_pool.hpp>
#include <blockforge/payload/build_arguments.hpp>
#include <blockforge/payload/build_outcome.hpp>
#include <blockforge/payload/errors.hpp>
#include <blockforge/payload/optimism/attributes.hpp>
#include <blockforge/payload/optimism/built_payload.hpp>
#include <blockforge/payload/payload_builder.hpp>

namespace blockforge::payload::optimism {

//! \brief Sequencer-aware rollup payload builder
//! \details The sequencer transactions open the block in the given order and are always included; pool
//! transactions follow unless the attributes set no_tx_pool. With no_tx_pool the first built payload is final.
class OptimismPayloadBuilder {
  public:
    using Attributes = OpPayloadAttributes;
    using Payload = OpBuiltPayload;
    using Error = PayloadBuilderError;
    using Arguments = BuildArguments<chain::TransactionPool, chain::ChainClient, Attributes, Payload>;

    tl::expected<BuildOutcome<Payload>, Error> try_build(Arguments args) const;

    //! The sequencer payload is mandatory: an empty payload must never replace it
    MissingPayloadBehaviour<Payload, Error> on_missing_payload(Arguments args) const;

    //! Payload with the sequencer transactions only
    tl::expected<Payload, Error> build_empty_payload(const chain::ChainClient& client,
                                                     const PayloadConfig<Attributes>& config) const;
};

static_assert(PayloadBuilder<OptimismPayloadBuilder, chain::TransactionPool, chain::ChainClient>);

}  // namespace blockforge::payload::optimism
