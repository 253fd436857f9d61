// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/common/bytes.hpp>
#include <blockforge/core/types/hash.hpp>
#include <blockforge/core/types/withdrawal.hpp>

namespace blockforge {

using namespace evmc::literals;

inline constexpr size_t kBloomByteLength{256};

using Bloom = std::array<uint8_t, kBloomByteLength>;

// Keccak-256 of the RLP of an empty list, i.e. the ommers hash of every post-merge block
inline constexpr evmc::bytes32 kEmptyListHash{
    0x1dcc4de8dec75d7aab85b567b6ccd41ad312451b948a7413f0a142fd40d49347_bytes32};

// Root hash of an empty trie
inline constexpr evmc::bytes32 kEmptyRoot{0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421_bytes32};

struct BlockHeader {
    evmc::bytes32 parent_hash{};
    evmc::bytes32 ommers_hash{kEmptyListHash};
    evmc::address beneficiary{};
    evmc::bytes32 state_root{};
    evmc::bytes32 transactions_root{};
    evmc::bytes32 receipts_root{};
    Bloom logs_bloom{};
    intx::uint256 difficulty{};
    BlockNum number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    BlockTime timestamp{0};

    Bytes extra_data{};

    evmc::bytes32 prev_randao{};
    std::array<uint8_t, 8> nonce{};

    // Added in London
    std::optional<intx::uint256> base_fee_per_gas{std::nullopt};  // EIP-1559

    // Added in Shanghai
    std::optional<evmc::bytes32> withdrawals_root{std::nullopt};  // EIP-4895

    // Added in Cancun
    std::optional<evmc::bytes32> parent_beacon_block_root{std::nullopt};  // EIP-4788

    Hash hash() const;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

//! A header together with its hash, computed once at sealing time
class SealedHeader {
  public:
    SealedHeader() = default;
    explicit SealedHeader(BlockHeader header) : header_{std::move(header)}, hash_{header_.hash()} {}

    const BlockHeader& header() const { return header_; }
    const Hash& hash() const { return hash_; }
    BlockNum number() const { return header_.number; }

    friend bool operator==(const SealedHeader&, const SealedHeader&) = default;

  private:
    BlockHeader header_;
    Hash hash_;
};

//! A finalized block: sealed header plus body, transactions carried as EIP-2718 envelopes
struct SealedBlock {
    SealedHeader header;
    std::vector<Bytes> transactions;
    std::optional<std::vector<Withdrawal>> withdrawals{std::nullopt};

    const Hash& hash() const { return header.hash(); }
    BlockNum number() const { return header.number(); }

    friend bool operator==(const SealedBlock&, const SealedBlock&) = default;
};

//! Flat commitment to an ordered list of transaction envelopes: keccak256 of the RLP list of their hashes
Hash transactions_commitment(const std::vector<Bytes>& transactions);

namespace rlp {
    void encode(Bytes& to, const BlockHeader&);
}  // namespace rlp

}  // namespace blockforge
