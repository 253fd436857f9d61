// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include <evmc/evmc.hpp>

#include <blockforge/core/types/account.hpp>
#include <blockforge/core/types/block.hpp>
#include <blockforge/core/types/hash.hpp>

namespace blockforge::chain {

//! Read access to canonical headers and to the execution state at a given block
class ChainClient {
  public:
    virtual ~ChainClient() = default;

    virtual uint64_t chain_id() const = 0;

    //! The sealed header of the block with the given hash, nullptr when unknown
    virtual std::shared_ptr<const SealedHeader> sealed_header(const Hash& block_hash) const = 0;

    //! The account state after executing the block with the given hash, nullopt when the account does not exist
    virtual std::optional<AccountInfo> account(const Hash& block_hash, const evmc::address& address) const = 0;

    //! The storage value after executing the block with the given hash (zero when unset)
    virtual evmc::bytes32 storage(const Hash& block_hash, const evmc::address& address,
                                  const evmc::bytes32& location) const = 0;
};

}  // namespace blockforge::chain
