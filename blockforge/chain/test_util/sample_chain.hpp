// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <utility>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blockforge/chain/in_memory_client.hpp>
#include <blockforge/chain/in_memory_pool.hpp>
#include <blockforge/core/common/base.hpp>
#include <blockforge/core/rlp/encode.hpp>
#include <blockforge/core/types/block.hpp>
#include <blockforge/core/types/transaction.hpp>

namespace blockforge::chain::test_util {

inline constexpr uint64_t kSampleChainId{1337};
inline constexpr uint64_t kSampleGasLimit{30'000'000};
inline constexpr BlockTime kSampleParentTimestamp{1'700'000'000};

//! Base fee of the sample parent; with gas_used at target the child keeps it
inline const intx::uint256 kSampleBaseFee{7 * kGiga};

inline constexpr evmc::address kAlice{0x00000000000000000000000000000000000a11ce_address};
inline constexpr evmc::address kBob{0x0000000000000000000000000000000000000b0b_address};
inline constexpr evmc::address kSequencer{0x4200000000000000000000000000000000000011_address};

//! An EIP-1559 transaction paying the given tip per gas on top of the sample base fee
inline RecoveredTransaction sample_transaction(const evmc::address& sender, uint64_t nonce, uint64_t tip_gwei,
                                               uint64_t gas_limit = 21'000) {
    Transaction txn{
        .type = TransactionType::kDynamicFee,
        .chain_id = kSampleChainId,
        .nonce = nonce,
        .max_priority_fee_per_gas = intx::uint256{tip_gwei} * kGiga,
        .max_fee_per_gas = kSampleBaseFee + intx::uint256{tip_gwei} * kGiga,
        .gas_limit = gas_limit,
        .to = kBob,
        .value = 1,
    };
    Bytes envelope;
    rlp::encode(envelope, txn);
    return *RecoveredTransaction::from_envelope(std::move(envelope), sender);
}

//! A deposit transaction envelope as forced by the sequencer
inline Bytes sample_deposit_envelope(uint8_t source, uint64_t gas_limit = 100'000) {
    Transaction txn{
        .type = TransactionType::kDeposit,
        .gas_limit = gas_limit,
        .to = kBob,
        .source_hash = evmc::bytes32{source},
        .from = kSequencer,
    };
    Bytes envelope;
    rlp::encode(envelope, txn);
    return envelope;
}

//! In-memory chain with one known parent block and an empty pool
struct SampleChain {
    std::shared_ptr<InMemoryChainClient> client{std::make_shared<InMemoryChainClient>(kSampleChainId)};
    std::shared_ptr<InMemoryTransactionPool> pool{std::make_shared<InMemoryTransactionPool>()};
    std::shared_ptr<const SealedHeader> parent;

    SampleChain() {
        parent = client->insert_header(BlockHeader{
            .state_root = evmc::bytes32{0x51},
            .number = 100,
            .gas_limit = kSampleGasLimit,
            .gas_used = kSampleGasLimit / 2,
            .timestamp = kSampleParentTimestamp,
            .base_fee_per_gas = kSampleBaseFee,
        });
    }

    void add(const RecoveredTransaction& transaction, TransactionOrigin origin = TransactionOrigin::kExternal) {
        pool->add_transaction(PooledTransaction{.transaction = transaction, .origin = origin});
    }
};

}  // namespace blockforge::chain::test_util
