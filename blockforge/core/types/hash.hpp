// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <bit>
#include <cstring>
#include <optional>
#include <string>

#include <ethash/hash_types.hpp>
#include <evmc/evmc.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/common/bytes.hpp>
#include <blockforge/core/common/util.hpp>

namespace blockforge {

class Hash : public evmc::bytes32 {
  public:
    using evmc::bytes32::bytes32;

    Hash() = default;

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    Hash(const evmc::bytes32& other) : evmc::bytes32{other} {}

    explicit Hash(const ethash::hash256& keccak) { std::memcpy(bytes, keccak.bytes, size()); }

    static constexpr size_t size() { return sizeof(evmc::bytes32); }

    std::string to_hex() const { return blockforge::to_hex(*this, /*with_prefix=*/true); }
    static std::optional<Hash> from_hex(const std::string& hex) { return evmc::from_hex<Hash>(hex); }

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    operator ByteView() const { return ByteView{bytes}; }

    static_assert(sizeof(evmc::bytes32) == 32);
};

//! Keccak-256 digest of the given bytes
inline Hash keccak_hash(ByteView data) { return Hash{keccak256(data)}; }

}  // namespace blockforge

namespace std {

template <>
struct hash<blockforge::Hash> : public std::hash<evmc::bytes32>  // to use Hash with hash maps
{};

}  // namespace std
