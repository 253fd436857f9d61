// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <tl/expected.hpp>

#include <blockforge/chain/chain_client.hpp>
#include <blockforge/chain/transaction_pool.hpp>
#include <blockforge/payload/build_arguments.hpp>
#include <blockforge/payload/build_outcome.hpp>
#include <blockforge/payload/errors.hpp>
#include <blockforge/payload/ethereum/attributes.hpp>
#include <blockforge/payload/ethereum/built_payload.hpp>
#include <blockforge/payload/payload_builder.hpp>

namespace blockforge::payload::ethereum {

struct EthereumBuilderConfig {
    //! Gas limit of built blocks, the parent's one if not set
    std::optional<uint64_t> gas_limit;
};

//! \brief Default Ethereum payload builder: best pool transactions by tip, greedily packed into the block gas limit
class EthereumPayloadBuilder {
  public:
    using Attributes = EthPayloadAttributes;
    using Payload = EthBuiltPayload;
    using Error = PayloadBuilderError;
    using Arguments = BuildArguments<chain::TransactionPool, chain::ChainClient, Attributes, Payload>;

    explicit EthereumPayloadBuilder(EthereumBuilderConfig config = {}) : config_{config} {}

    tl::expected<BuildOutcome<Payload>, Error> try_build(Arguments args) const;

    //! The parent and the attributes are enough for a valid block, so an empty payload is always worth racing
    MissingPayloadBehaviour<Payload, Error> on_missing_payload(Arguments args) const;

    tl::expected<Payload, Error> build_empty_payload(const chain::ChainClient& client,
                                                     const PayloadConfig<Attributes>& config) const;

    const EthereumBuilderConfig& config() const { return config_; }

  private:
    EthereumBuilderConfig config_;
};

static_assert(PayloadBuilder<EthereumPayloadBuilder, chain::TransactionPool, chain::ChainClient>);

}  // namespace blockforge::payload::ethereum
