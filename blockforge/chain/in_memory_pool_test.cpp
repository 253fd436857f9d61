// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <blockforge/chain/test_util/sample_chain.hpp>

namespace blockforge::chain {

using namespace blockforge::chain::test_util;

static std::vector<Hash> hashes_of(const std::vector<PooledTransaction>& transactions) {
    std::vector<Hash> hashes;
    for (const auto& pooled : transactions) {
        hashes.push_back(pooled.transaction.hash);
    }
    return hashes;
}

TEST_CASE("InMemoryTransactionPool rejects duplicates", "[blockforge][chain][pool]") {
    InMemoryTransactionPool pool;
    const auto txn{sample_transaction(kAlice, 0, 2)};
    CHECK(pool.add_transaction({.transaction = txn}));
    CHECK_FALSE(pool.add_transaction({.transaction = txn}));
    CHECK(pool.size() == 1);
}

TEST_CASE("InMemoryTransactionPool orders by tip and keeps sender nonces increasing", "[blockforge][chain][pool]") {
    InMemoryTransactionPool pool;
    const auto alice_1{sample_transaction(kAlice, 1, 9)};
    const auto alice_0{sample_transaction(kAlice, 0, 1)};
    const auto bob_0{sample_transaction(kBob, 0, 5)};
    REQUIRE(pool.add_transaction({.transaction = alice_1}));
    REQUIRE(pool.add_transaction({.transaction = alice_0}));
    REQUIRE(pool.add_transaction({.transaction = bob_0}));

    // alice's slots are first and last, filled in nonce order
    CHECK(hashes_of(pool.best_transactions(kSampleBaseFee)) == std::vector<Hash>{alice_0.hash, bob_0.hash, alice_1.hash});
}

TEST_CASE("InMemoryTransactionPool filters by base fee", "[blockforge][chain][pool]") {
    InMemoryTransactionPool pool;
    const auto txn{sample_transaction(kAlice, 0, 2)};
    REQUIRE(pool.add_transaction({.transaction = txn}));
    CHECK(pool.best_transactions(kSampleBaseFee).size() == 1);
    CHECK(pool.best_transactions(kSampleBaseFee * 2).empty());
}

TEST_CASE("InMemoryTransactionPool never offers deposits", "[blockforge][chain][pool]") {
    InMemoryTransactionPool pool;
    auto deposit{RecoveredTransaction::from_envelope(sample_deposit_envelope(1))};
    REQUIRE(deposit);
    REQUIRE(pool.add_transaction({.transaction = *deposit}));
    CHECK(pool.best_transactions(0).empty());
    CHECK(pool.size() == 1);
}

TEST_CASE("InMemoryTransactionPool by origin and removal", "[blockforge][chain][pool]") {
    InMemoryTransactionPool pool;
    const auto local{sample_transaction(kAlice, 0, 2)};
    const auto external{sample_transaction(kBob, 0, 2)};
    REQUIRE(pool.add_transaction({.transaction = local, .origin = TransactionOrigin::kLocal}));
    REQUIRE(pool.add_transaction({.transaction = external, .origin = TransactionOrigin::kExternal}));

    CHECK(hashes_of(pool.transactions_by_origin(TransactionOrigin::kLocal)) == std::vector<Hash>{local.hash});
    CHECK(pool.transactions_by_origin(TransactionOrigin::kPrivate).empty());

    pool.remove_transactions({local.hash, Hash{}});
    CHECK(pool.size() == 1);
    CHECK(pool.add_transaction({.transaction = local}));
}

}  // namespace blockforge::chain
