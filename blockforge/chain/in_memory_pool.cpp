// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_pool.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace blockforge::chain {

bool InMemoryTransactionPool::add_transaction(PooledTransaction transaction) {
    std::scoped_lock lock{mutex_};
    if (!hashes_.insert(transaction.transaction.hash).second) {
        return false;
    }
    transactions_.push_back(std::move(transaction));
    return true;
}

void InMemoryTransactionPool::remove_transactions(const std::vector<Hash>& hashes) {
    std::scoped_lock lock{mutex_};
    for (const auto& hash : hashes) {
        if (hashes_.erase(hash) == 0) continue;
        std::erase_if(transactions_, [&](const PooledTransaction& pooled) { return pooled.transaction.hash == hash; });
    }
}

std::vector<PooledTransaction> InMemoryTransactionPool::best_transactions(const intx::uint256& base_fee) const {
    std::vector<std::pair<intx::uint256, PooledTransaction>> candidates;
    {
        std::scoped_lock lock{mutex_};
        for (const auto& pooled : transactions_) {
            const auto tip{pooled.transaction.transaction.effective_tip(base_fee)};
            if (!tip || pooled.transaction.transaction.is_deposit()) continue;  // deposits only come from the sequencer
            candidates.emplace_back(*tip, pooled);
        }
    }
    // Highest tip first, arrival order among equal tips
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.first > rhs.first; });

    // Each sender keeps the slots its transactions got, filled in nonce order
    FlatHashMap<evmc::address, std::vector<size_t>> slots_by_sender;
    for (size_t i{0}; i < candidates.size(); ++i) {
        slots_by_sender[candidates[i].second.transaction.sender].push_back(i);
    }
    for (const auto& [_, slots] : slots_by_sender) {
        std::vector<size_t> by_nonce{slots};
        std::stable_sort(by_nonce.begin(), by_nonce.end(), [&](size_t lhs, size_t rhs) {
            return candidates[lhs].second.transaction.transaction.nonce < candidates[rhs].second.transaction.transaction.nonce;
        });
        std::vector<PooledTransaction> reordered;
        reordered.reserve(by_nonce.size());
        for (const size_t index : by_nonce) {
            reordered.push_back(candidates[index].second);
        }
        for (size_t i{0}; i < slots.size(); ++i) {
            candidates[slots[i]].second = std::move(reordered[i]);
        }
    }

    std::vector<PooledTransaction> best;
    best.reserve(candidates.size());
    for (auto& [_, pooled] : candidates) {
        best.push_back(std::move(pooled));
    }
    return best;
}

std::vector<PooledTransaction> InMemoryTransactionPool::transactions_by_origin(TransactionOrigin origin) const {
    std::scoped_lock lock{mutex_};
    std::vector<PooledTransaction> selected;
    std::copy_if(transactions_.cbegin(), transactions_.cend(), std::back_inserter(selected),
                 [&](const PooledTransaction& pooled) { return pooled.origin == origin; });
    return selected;
}

size_t InMemoryTransactionPool::size() const {
    std::scoped_lock lock{mutex_};
    return transactions_.size();
}

}  // namespace blockforge::chain
