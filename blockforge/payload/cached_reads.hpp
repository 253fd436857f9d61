// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>

#include <evmc/evmc.hpp>

#include <blockforge/chain/chain_client.hpp>
#include <blockforge/core/common/hash_maps.hpp>
#include <blockforge/core/types/account.hpp>
#include <blockforge/core/types/hash.hpp>

namespace blockforge::payload {

//! \brief State reads performed by a build attempt, reused by later attempts on the same parent
//! \details Reads go through the cache first and fall back to the chain client, recording what the client returned
//! (absent accounts included). Caches are plain values: copying one yields an independent cache.
class CachedReads {
  public:
    //! Account at the given block, served from cache or read through the client
    std::optional<AccountInfo> account(const chain::ChainClient& client, const Hash& block_hash,
                                       const evmc::address& address);

    //! Storage slot at the given block, served from cache or read through the client
    evmc::bytes32 storage(const chain::ChainClient& client, const Hash& block_hash, const evmc::address& address,
                          const evmc::bytes32& location);

    void insert_account(const evmc::address& address, std::optional<AccountInfo> account);
    void insert_storage(const evmc::address& address, const evmc::bytes32& location, const evmc::bytes32& value);

    //! \brief Merge the reads of a later attempt into this cache
    //! \remarks entries of other take precedence since they were read last
    void extend(CachedReads other);

    bool contains_account(const evmc::address& address) const { return accounts_.contains(address); }
    size_t num_accounts() const { return accounts_.size(); }
    size_t num_storage_slots() const;
    bool empty() const { return accounts_.empty(); }

    friend bool operator==(const CachedReads&, const CachedReads&) = default;

  private:
    struct CachedAccount {
        std::optional<AccountInfo> info;
        FlatHashMap<evmc::bytes32, evmc::bytes32> storage;
        bool info_loaded{false};

        friend bool operator==(const CachedAccount&, const CachedAccount&) = default;
    };

    FlatHashMap<evmc::address, CachedAccount> accounts_;
};

}  // namespace blockforge::payload
