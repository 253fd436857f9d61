// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <vector>

#include <intx/intx.hpp>

#include <blockforge/core/types/transaction.hpp>

namespace blockforge::chain {

//! A transaction waiting in the pool, tagged with where it came from
struct PooledTransaction {
    RecoveredTransaction transaction;
    TransactionOrigin origin{TransactionOrigin::kExternal};
};

//! Read access to the pending transactions a payload builder may include
class TransactionPool {
  public:
    virtual ~TransactionPool() = default;

    //! \brief Transactions ready for inclusion in a block with the given base fee, best effective tip first
    //! \remarks transactions whose fee cap does not cover the base fee are never returned
    virtual std::vector<PooledTransaction> best_transactions(const intx::uint256& base_fee) const = 0;

    //! All pending transactions that entered the pool through the given origin, in arrival order
    virtual std::vector<PooledTransaction> transactions_by_origin(TransactionOrigin origin) const = 0;

    virtual size_t size() const = 0;
};

}  // namespace blockforge::chain
