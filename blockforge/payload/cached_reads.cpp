// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "cached_reads.hpp"

#include <utility>

namespace blockforge::payload {

std::optional<AccountInfo> CachedReads::account(const chain::ChainClient& client, const Hash& block_hash,
                                                const evmc::address& address) {
    auto& cached{accounts_[address]};
    if (!cached.info_loaded) {
        cached.info = client.account(block_hash, address);
        cached.info_loaded = true;
    }
    return cached.info;
}

evmc::bytes32 CachedReads::storage(const chain::ChainClient& client, const Hash& block_hash,
                                   const evmc::address& address, const evmc::bytes32& location) {
    auto& slots{accounts_[address].storage};
    const auto it{slots.find(location)};
    if (it != slots.end()) {
        return it->second;
    }
    const evmc::bytes32 value{client.storage(block_hash, address, location)};
    slots.emplace(location, value);
    return value;
}

void CachedReads::insert_account(const evmc::address& address, std::optional<AccountInfo> account) {
    auto& cached{accounts_[address]};
    cached.info = std::move(account);
    cached.info_loaded = true;
}

void CachedReads::insert_storage(const evmc::address& address, const evmc::bytes32& location,
                                 const evmc::bytes32& value) {
    accounts_[address].storage.insert_or_assign(location, value);
}

void CachedReads::extend(CachedReads other) {
    for (auto& [address, account] : other.accounts_) {
        auto& cached{accounts_[address]};
        if (account.info_loaded) {
            cached.info = std::move(account.info);
            cached.info_loaded = true;
        }
        for (const auto& [location, value] : account.storage) {
            cached.storage.insert_or_assign(location, value);
        }
    }
}

size_t CachedReads::num_storage_slots() const {
    size_t count{0};
    for (const auto& [_, account] : accounts_) {
        count += account.storage.size();
    }
    return count;
}

}  // namespace blockforge::payload
