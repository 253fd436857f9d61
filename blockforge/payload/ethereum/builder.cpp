// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "builder.hpp"

#include <utility>

#include <blockforge/infra/common/log.hpp>
#include <blockforge/payload/block_assembly.hpp>
#include <blockforge/payload/payload_id.hpp>

namespace blockforge::payload::ethereum {

tl::expected<BuildOutcome<EthBuiltPayload>, PayloadBuilderError> EthereumPayloadBuilder::try_build(Arguments args) const {
    const auto parent{resolve_parent_header(*args.client, args.config)};
    if (!parent) {
        return tl::unexpected{PayloadBuilderError::missing_parent_header(args.config.parent_hash().to_hex())};
    }
    if (args.cancel.is_cancelled()) {
        return Cancelled{};
    }

    const PayloadId id{args.config.attributes.payload_id()};
    const auto block_template{BlockTemplate::from_config(parent, args.config, config_.gas_limit)};
    TransactionSelection selection;
    if (!select_pool_transactions(*args.pool, *args.client, args.cached_reads, args.cancel, block_template, selection)) {
        FORGE_DEBUG_M("EthereumPayloadBuilder") << "build of " << payload_id_to_hex(id) << " cancelled";
        return Cancelled{};
    }

    // Never hand back a payload that does not pay more than the best one already known
    if (args.best_payload && selection.fees <= args.best_payload->fees()) {
        FORGE_TRACE_M("EthereumPayloadBuilder") << "build of " << payload_id_to_hex(id) << " not better than best";
        return Aborted{.fees = args.best_payload->fees(), .cached_reads = std::move(args.cached_reads)};
    }

    const intx::uint256 fees{selection.fees};
    const size_t num_transactions{selection.envelopes.size()};
    EthBuiltPayload payload{id, seal_block(block_template, std::move(selection)), fees};
    log::Debug("EthereumPayloadBuilder: built payload",
               {"id", payload_id_to_hex(id),
                "block", std::to_string(payload.block().number()),
                "txs", std::to_string(num_transactions),
                "fees", intx::to_string(fees)});
    return Better<EthBuiltPayload>{.payload = std::move(payload), .cached_reads = std::move(args.cached_reads)};
}

MissingPayloadBehaviour<EthBuiltPayload, PayloadBuilderError> EthereumPayloadBuilder::on_missing_payload(
    Arguments /*args*/) const {
    return RaceEmptyPayload{};
}

tl::expected<EthBuiltPayload, PayloadBuilderError> EthereumPayloadBuilder::build_empty_payload(
    const chain::ChainClient& client, const PayloadConfig<Attributes>& config) const {
    const auto parent{resolve_parent_header(client, config)};
    if (!parent) {
        return tl::unexpected{PayloadBuilderError::missing_parent_header(config.parent_hash().to_hex())};
    }
    const auto block_template{BlockTemplate::from_config(parent, config, config_.gas_limit)};
    return EthBuiltPayload{config.attributes.payload_id(), seal_block(block_template, {}), 0};
}

}  // namespace blockforge::payload::ethereum
