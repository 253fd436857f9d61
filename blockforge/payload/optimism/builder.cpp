// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "builder.hpp"

#include <utility>

#include <blockforge/infra/common/log.hpp>
#include <blockforge/payload/block_assembly.hpp>
#include <blockforge/payload/payload_id.hpp>

namespace blockforge::payload::optimism {

//! Sequencer transactions are mandatory, so one not fitting the block fails the whole build
static tl::expected<TransactionSelection, PayloadBuilderError> select_sequencer_transactions(
    const OpPayloadAttributes& attributes, const BlockTemplate& block_template) {
    TransactionSelection selection;
    for (const auto& recovered : attributes.sequencer_transactions()) {
        if (!selection.fits(recovered.transaction.gas_limit, block_template.gas_limit)) {
            return tl::unexpected{PayloadBuilderError{PayloadBuilderError::Code::kExecutionError,
                                                      "sequencer transactions exceed the block gas limit"}};
        }
        selection.add(recovered, recovered.transaction.effective_tip(block_template.base_fee_per_gas).value_or(0));
    }
    return selection;
}

tl::expected<BuildOutcome<OpBuiltPayload>, PayloadBuilderError> OptimismPayloadBuilder::try_build(Arguments args) const {
    const auto parent{resolve_parent_header(*args.client, args.config)};
    if (!parent) {
        return tl::unexpected{PayloadBuilderError::missing_parent_header(args.config.parent_hash().to_hex())};
    }
    if (args.cancel.is_cancelled()) {
        return Cancelled{};
    }

    const auto& attributes{args.config.attributes};
    const PayloadId id{attributes.payload_id()};
    if (attributes.no_tx_pool() && args.best_payload) {
        // Nothing can change once the pool is excluded
        return Aborted{.fees = args.best_payload->fees(), .cached_reads = std::move(args.cached_reads)};
    }

    const auto block_template{BlockTemplate::from_config(parent, args.config, attributes.gas_limit())};
    auto sequencer_selection{select_sequencer_transactions(attributes, block_template)};
    if (!sequencer_selection) {
        return tl::unexpected{std::move(sequencer_selection.error())};
    }
    TransactionSelection selection{std::move(*sequencer_selection)};
    const size_t sequencer_transaction_count{selection.envelopes.size()};
    if (!attributes.no_tx_pool() &&
        !select_pool_transactions(*args.pool, *args.client, args.cached_reads, args.cancel, block_template, selection)) {
        FORGE_DEBUG_M("OptimismPayloadBuilder") << "build of " << payload_id_to_hex(id) << " cancelled";
        return Cancelled{};
    }

    if (args.best_payload && selection.fees <= args.best_payload->fees()) {
        return Aborted{.fees = args.best_payload->fees(), .cached_reads = std::move(args.cached_reads)};
    }

    const intx::uint256 fees{selection.fees};
    OpBuiltPayload payload{id, seal_block(block_template, std::move(selection)), fees, sequencer_transaction_count};
    log::Debug("OptimismPayloadBuilder: built payload",
               {"id", payload_id_to_hex(id),
                "block", std::to_string(payload.block().number()),
                "sequencer_txs", std::to_string(sequencer_transaction_count),
                "txs", std::to_string(payload.block().transactions.size()),
                "fees", intx::to_string(fees)});
    return Better<OpBuiltPayload>{.payload = std::move(payload), .cached_reads = std::move(args.cached_reads)};
}

MissingPayloadBehaviour<OpBuiltPayload, PayloadBuilderError> OptimismPayloadBuilder::on_missing_payload(
    Arguments /*args*/) const {
    return AwaitInProgress{};
}

tl::expected<OpBuiltPayload, PayloadBuilderError> OptimismPayloadBuilder::build_empty_payload(
    const chain::ChainClient& client, const PayloadConfig<Attributes>& config) const {
    const auto parent{resolve_parent_header(client, config)};
    if (!parent) {
        return tl::unexpected{PayloadBuilderError::missing_parent_header(config.parent_hash().to_hex())};
    }
    const auto& attributes{config.attributes};
    const auto block_template{BlockTemplate::from_config(parent, config, attributes.gas_limit())};
    auto selection{select_sequencer_transactions(attributes, block_template)};
    if (!selection) {
        return tl::unexpected{std::move(selection.error())};
    }
    const intx::uint256 fees{selection->fees};
    const size_t sequencer_transaction_count{selection->envelopes.size()};
    return OpBuiltPayload{attributes.payload_id(), seal_block(block_template, std::move(*selection)), fees,
                          sequencer_transaction_count};
}

}  // namespace blockforge::payload::optimism
