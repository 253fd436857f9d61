// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_assembly.hpp"

#include <blockforge/core/common/hash_maps.hpp>
#include <blockforge/infra/common/log.hpp>

namespace blockforge::payload {

intx::uint256 expected_base_fee_per_gas(const BlockHeader& parent) {
    if (!parent.base_fee_per_gas) {
        return kInitialBaseFee;
    }

    const uint64_t parent_gas_target{parent.gas_limit / kElasticityMultiplier};
    const intx::uint256& parent_base_fee_per_gas{*parent.base_fee_per_gas};

    if (parent.gas_used == parent_gas_target || parent_gas_target == 0) {
        return parent_base_fee_per_gas;
    }

    if (parent.gas_used > parent_gas_target) {
        const intx::uint256 gas_used_delta{parent.gas_used - parent_gas_target};
        intx::uint256 base_fee_per_gas_delta{parent_base_fee_per_gas * gas_used_delta / parent_gas_target /
                                             kBaseFeeMaxChangeDenominator};
        if (base_fee_per_gas_delta < 1) {
            base_fee_per_gas_delta = 1;
        }
        return parent_base_fee_per_gas + base_fee_per_gas_delta;
    }

    const intx::uint256 gas_used_delta{parent_gas_target - parent.gas_used};
    const intx::uint256 base_fee_per_gas_delta{parent_base_fee_per_gas * gas_used_delta / parent_gas_target /
                                               kBaseFeeMaxChangeDenominator};
    if (parent_base_fee_per_gas > base_fee_per_gas_delta) {
        return parent_base_fee_per_gas - base_fee_per_gas_delta;
    }
    return 0;
}

void TransactionSelection::add(const RecoveredTransaction& transaction, const intx::uint256& tip) {
    envelopes.push_back(transaction.envelope);
    hashes.push_back(transaction.hash);
    gas_used += transaction.transaction.gas_limit;
    fees += tip * transaction.transaction.gas_limit;
}

bool select_pool_transactions(const chain::TransactionPool& pool, const chain::ChainClient& client,
                              CachedReads& cached_reads, const CancellationToken& cancel,
                              const BlockTemplate& block_template, TransactionSelection& selection) {
    const Hash& state_block{block_template.parent->hash()};
    FlatHashMap<evmc::address, uint64_t> next_nonces;
    for (const auto& pooled : pool.best_transactions(block_template.base_fee_per_gas)) {
        if (cancel.is_cancelled()) {
            return false;
        }
        const auto& recovered{pooled.transaction};
        const auto& txn{recovered.transaction};
        if (!selection.fits(txn.gas_limit, block_template.gas_limit)) {
            FORGE_TRACE_M("BlockAssembly") << "skipping " << recovered.hash.to_hex() << ": exceeds block gas limit";
            continue;
        }
        auto [nonce_it, first_of_sender]{next_nonces.try_emplace(recovered.sender, 0)};
        if (first_of_sender) {
            const auto account{cached_reads.account(client, state_block, recovered.sender)};
            nonce_it->second = account ? account->nonce : 0;
        }
        if (txn.nonce != nonce_it->second) {
            FORGE_TRACE_M("BlockAssembly") << "skipping " << recovered.hash.to_hex() << ": nonce gap";
            continue;
        }
        const auto tip{txn.effective_tip(block_template.base_fee_per_gas)};
        if (!tip) {
            continue;
        }
        selection.add(recovered, *tip);
        ++nonce_it->second;
    }
    return !cancel.is_cancelled();
}

SealedBlock seal_block(const BlockTemplate& block_template, TransactionSelection selection) {
    const BlockHeader& parent{block_template.parent->header()};
    BlockHeader header{
        .parent_hash = block_template.parent->hash(),
        .beneficiary = block_template.beneficiary,
        .state_root = parent.state_root,
        .transactions_root = transactions_commitment(selection.envelopes),
        .receipts_root = kEmptyRoot,
        .number = parent.number + 1,
        .gas_limit = block_template.gas_limit,
        .gas_used = selection.gas_used,
        .timestamp = block_template.timestamp,
        .extra_data = block_template.extra_data,
        .prev_randao = block_template.prev_randao,
        .base_fee_per_gas = block_template.base_fee_per_gas,
        .parent_beacon_block_root = block_template.parent_beacon_block_root,
    };
    if (block_template.withdrawals) {
        header.withdrawals_root = withdrawals_commitment(*block_template.withdrawals);
    }
    return SealedBlock{
        .header = SealedHeader{std::move(header)},
        .transactions = std::move(selection.envelopes),
        .withdrawals = block_template.withdrawals,
    };
}

}  // namespace blockforge::payload
