// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_client.hpp"

namespace blockforge::chain {

std::shared_ptr<const SealedHeader> InMemoryChainClient::insert_header(BlockHeader header) {
    auto sealed{std::make_shared<const SealedHeader>(std::move(header))};
    std::scoped_lock lock{mutex_};
    headers_.insert_or_assign(sealed->hash(), sealed);
    return sealed;
}

void InMemoryChainClient::set_account(const evmc::address& address, const AccountInfo& account) {
    std::scoped_lock lock{mutex_};
    accounts_.insert_or_assign(address, account);
}

void InMemoryChainClient::set_storage(const evmc::address& address, const evmc::bytes32& location,
                                      const evmc::bytes32& value) {
    std::scoped_lock lock{mutex_};
    storage_[address].insert_or_assign(location, value);
}

std::shared_ptr<const SealedHeader> InMemoryChainClient::sealed_header(const Hash& block_hash) const {
    std::scoped_lock lock{mutex_};
    const auto it{headers_.find(block_hash)};
    return it != headers_.end() ? it->second : nullptr;
}

bool InMemoryChainClient::is_known_block(const Hash& block_hash) const {
    return headers_.contains(block_hash);
}

std::optional<AccountInfo> InMemoryChainClient::account(const Hash& block_hash, const evmc::address& address) const {
    std::scoped_lock lock{mutex_};
    if (!is_known_block(block_hash)) return std::nullopt;
    const auto it{accounts_.find(address)};
    if (it == accounts_.end()) return std::nullopt;
    return it->second;
}

evmc::bytes32 InMemoryChainClient::storage(const Hash& block_hash, const evmc::address& address,
                                           const evmc::bytes32& location) const {
    std::scoped_lock lock{mutex_};
    if (!is_known_block(block_hash)) return {};
    const auto account_it{storage_.find(address)};
    if (account_it == storage_.end()) return {};
    const auto slot_it{account_it->second.find(location)};
    return slot_it != account_it->second.end() ? slot_it->second : evmc::bytes32{};
}

}  // namespace blockforge::chain
