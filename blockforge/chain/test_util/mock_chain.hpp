// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmock/gmock.h>

#include <blockforge/chain/chain_client.hpp>
#include <blockforge/chain/transaction_pool.hpp>

namespace blockforge::chain::test_util {

class MockTransactionPool : public TransactionPool {
  public:
    MOCK_METHOD((std::vector<PooledTransaction>), best_transactions, (const intx::uint256&), (const, override));
    MOCK_METHOD((std::vector<PooledTransaction>), transactions_by_origin, (TransactionOrigin), (const, override));
    MOCK_METHOD(size_t, size, (), (const, override));
};

class MockChainClient : public ChainClient {
  public:
    MOCK_METHOD(uint64_t, chain_id, (), (const, override));
    MOCK_METHOD((std::shared_ptr<const SealedHeader>), sealed_header, (const Hash&), (const, override));
    MOCK_METHOD((std::optional<AccountInfo>), account, (const Hash&, const evmc::address&), (const, override));
    MOCK_METHOD(evmc::bytes32, storage, (const Hash&, const evmc::address&, const evmc::bytes32&), (const, override));
};

}  // namespace blockforge::chain::test_util
