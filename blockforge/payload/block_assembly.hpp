// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blockforge/chain/chain_client.hpp>
#include <blockforge/chain/transaction_pool.hpp>
#include <blockforge/core/common/bytes.hpp>
#include <blockforge/core/types/block.hpp>
#include <blockforge/core/types/transaction.hpp>
#include <blockforge/infra/concurrency/cancellation_token.hpp>
#include <blockforge/payload/attributes.hpp>
#include <blockforge/payload/cached_reads.hpp>

namespace blockforge::payload {

// EIP-1559: Fee market change for ETH 1.0 chain
inline constexpr uint64_t kInitialBaseFee{kGiga};
inline constexpr uint64_t kBaseFeeMaxChangeDenominator{8};
inline constexpr uint64_t kElasticityMultiplier{2};

//! Base fee of the block following parent
intx::uint256 expected_base_fee_per_gas(const BlockHeader& parent);

//! Parent header from the config, or looked up through the client when the config carries none
template <class A>
std::shared_ptr<const SealedHeader> resolve_parent_header(const chain::ChainClient& client,
                                                          const PayloadConfig<A>& config) {
    return config.parent_header ? config.parent_header : client.sealed_header(config.parent_hash());
}

//! Header fields of the block under construction known before any transaction is picked
struct BlockTemplate {
    std::shared_ptr<const SealedHeader> parent;
    BlockTime timestamp{0};
    evmc::address beneficiary{};
    evmc::bytes32 prev_randao{};
    uint64_t gas_limit{0};
    intx::uint256 base_fee_per_gas;
    Bytes extra_data;
    std::optional<std::vector<Withdrawal>> withdrawals;
    std::optional<evmc::bytes32> parent_beacon_block_root;

    template <class A>
    static BlockTemplate from_config(std::shared_ptr<const SealedHeader> parent, const PayloadConfig<A>& config,
                                     std::optional<uint64_t> gas_limit) {
        const auto& attributes{config.attributes};
        const uint64_t block_gas_limit{gas_limit.value_or(parent->header().gas_limit)};
        const intx::uint256 base_fee{expected_base_fee_per_gas(parent->header())};
        return {
            .parent = std::move(parent),
            .timestamp = attributes.timestamp(),
            .beneficiary = attributes.suggested_fee_recipient(),
            .prev_randao = attributes.prev_randao(),
            .gas_limit = block_gas_limit,
            .base_fee_per_gas = base_fee,
            .extra_data = config.extra_data,
            .withdrawals = attributes.withdrawals(),
            .parent_beacon_block_root = attributes.parent_beacon_block_root(),
        };
    }
};

//! Transactions picked for a block together with their accounting
struct TransactionSelection {
    std::vector<Bytes> envelopes;
    std::vector<Hash> hashes;
    uint64_t gas_used{0};
    intx::uint256 fees;

    //! Whether a transaction with the given gas limit fits the gas left below block_gas_limit
    bool fits(uint64_t gas_limit, uint64_t block_gas_limit) const {
        return gas_used <= block_gas_limit && gas_limit <= block_gas_limit - gas_used;
    }

    //! Append a transaction paying the given tip per gas
    //! \pre fits(transaction gas limit, block gas limit)
    void add(const RecoveredTransaction& transaction, const intx::uint256& tip);
};

//! \brief Greedily append the best pool transactions that fit the remaining gas of the block
//! \details Transactions come in the pool order; one that does not fit is skipped so that smaller ones may still
//! fit, and one whose nonce is not the next of its sender (as read through cached_reads) is skipped as well.
//! \return false if cancellation was observed, in which case selection must be discarded
bool select_pool_transactions(const chain::TransactionPool& pool, const chain::ChainClient& client,
                              CachedReads& cached_reads, const CancellationToken& cancel,
                              const BlockTemplate& block_template, TransactionSelection& selection);

//! \brief Seal the block made of the template and the selected transactions
//! \remarks without execution the state root is the parent's and gas used counts transaction gas limits; roots
//! over transactions and withdrawals are flat commitments
SealedBlock seal_block(const BlockTemplate& block_template, TransactionSelection selection);

}  // namespace blockforge::payload
