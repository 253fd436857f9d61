// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <mutex>
#include <vector>

#include <blockforge/chain/transaction_pool.hpp>
#include <blockforge/core/common/hash_maps.hpp>

namespace blockforge::chain {

//! Transaction pool kept entirely in memory, safe for concurrent readers and writers
class InMemoryTransactionPool : public TransactionPool {
  public:
    InMemoryTransactionPool() = default;

    InMemoryTransactionPool(const InMemoryTransactionPool&) = delete;
    InMemoryTransactionPool& operator=(const InMemoryTransactionPool&) = delete;

    //! \brief Adds a transaction to the pool
    //! \return false if a transaction with the same hash is already pending
    bool add_transaction(PooledTransaction transaction);

    //! Removes the given transactions, e.g. once included in a sealed block
    void remove_transactions(const std::vector<Hash>& hashes);

    std::vector<PooledTransaction> best_transactions(const intx::uint256& base_fee) const override;
    std::vector<PooledTransaction> transactions_by_origin(TransactionOrigin origin) const override;
    size_t size() const override;

  private:
    mutable std::mutex mutex_;
    std::vector<PooledTransaction> transactions_;  // arrival order
    FlatHashSet<Hash> hashes_;
};

}  // namespace blockforge::chain
