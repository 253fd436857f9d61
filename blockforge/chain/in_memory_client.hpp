// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <mutex>

#include <blockforge/chain/chain_client.hpp>
#include <blockforge/core/common/hash_maps.hpp>

namespace blockforge::chain {

//! \brief Chain client backed by in-memory maps
//! \remarks holds a single state snapshot, served for every known block
class InMemoryChainClient : public ChainClient {
  public:
    explicit InMemoryChainClient(uint64_t chain_id) : chain_id_{chain_id} {}

    InMemoryChainClient(const InMemoryChainClient&) = delete;
    InMemoryChainClient& operator=(const InMemoryChainClient&) = delete;

    //! Seals the header and makes it known, returning the sealed header
    std::shared_ptr<const SealedHeader> insert_header(BlockHeader header);

    void set_account(const evmc::address& address, const AccountInfo& account);
    void set_storage(const evmc::address& address, const evmc::bytes32& location, const evmc::bytes32& value);

    uint64_t chain_id() const override { return chain_id_; }
    std::shared_ptr<const SealedHeader> sealed_header(const Hash& block_hash) const override;
    std::optional<AccountInfo> account(const Hash& block_hash, const evmc::address& address) const override;
    evmc::bytes32 storage(const Hash& block_hash, const evmc::address& address,
                          const evmc::bytes32& location) const override;

  private:
    bool is_known_block(const Hash& block_hash) const;

    const uint64_t chain_id_;
    mutable std::mutex mutex_;
    FlatHashMap<Hash, std::shared_ptr<const SealedHeader>> headers_;
    FlatHashMap<evmc::address, AccountInfo> accounts_;
    FlatHashMap<evmc::address, FlatHashMap<evmc::bytes32, evmc::bytes32>> storage_;
};

}  // namespace blockforge::chain
