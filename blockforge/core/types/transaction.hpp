// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blockforge/core/common/bytes.hpp>
#include <blockforge/core/common/decoding_result.hpp>
#include <blockforge/core/types/hash.hpp>

namespace blockforge {

// EIP-2718 transaction type
// https://github.com/ethereum/eth1.0-specs/tree/master/lists/signature-types
enum class TransactionType : uint8_t {
    kLegacy = 0,
    kAccessList = 1,  // EIP-2930
    kDynamicFee = 2,  // EIP-1559
    kBlob = 3,        // EIP-4844
    kDeposit = 0x7E,  // rollup deposit, injected by the sequencer
};

//! The fields of a transaction relevant to payload construction; signatures, access lists and blob fields
//! are carried by the envelope bytes only
struct Transaction {
    TransactionType type{TransactionType::kLegacy};

    std::optional<uint64_t> chain_id{std::nullopt};  // nullopt for legacy transactions without EIP-155
    uint64_t nonce{0};
    intx::uint256 max_priority_fee_per_gas{0};  // equals gas price for pre-EIP-1559 types
    intx::uint256 max_fee_per_gas{0};           // equals gas price for pre-EIP-1559 types
    uint64_t gas_limit{0};
    std::optional<evmc::address> to{std::nullopt};
    intx::uint256 value{0};
    Bytes data{};

    // Deposit transactions only
    std::optional<evmc::bytes32> source_hash{std::nullopt};
    std::optional<evmc::address> from{std::nullopt};
    intx::uint256 mint{0};
    bool is_system_transaction{false};

    bool is_deposit() const { return type == TransactionType::kDeposit; }

    //! \brief The tip per gas unit paid to the fee recipient given the block base fee
    //! \return nullopt when the fee cap does not cover the base fee (i.e. the transaction is not includable)
    //! \remarks deposits pay no tip and are always includable
    std::optional<intx::uint256> effective_tip(const intx::uint256& base_fee) const;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

//! \brief Decodes an EIP-2718 envelope (or a legacy RLP list) into its payload construction fields
//! \remarks the decoder validates the whole envelope structure, including fields it does not retain
tl::expected<Transaction, DecodingError> decode_transaction(ByteView envelope) noexcept;

//! Where a transaction entered the node
enum class TransactionOrigin : uint8_t {
    kLocal,     // submitted through the local RPC
    kExternal,  // received from peers
    kPrivate,   // submitted privately, never propagated
};

//! A decoded transaction together with its envelope bytes, hash and sender
struct RecoveredTransaction {
    Transaction transaction;
    Bytes envelope;
    Hash hash;
    evmc::address sender{};

    //! \brief Decodes the envelope and computes the transaction hash
    //! \remarks deposit senders come from the envelope itself, for other types the caller provides the sender
    static tl::expected<RecoveredTransaction, DecodingError> from_envelope(Bytes envelope, const evmc::address& sender = {});

    friend bool operator==(const RecoveredTransaction&, const RecoveredTransaction&) = default;
};

namespace rlp {
    //! \brief Encodes a transaction envelope with an empty access list and a zeroed signature
    //! \remarks intended for locally produced transactions (dev tooling and tests); blob transactions are not encodable
    void encode(Bytes& to, const Transaction& txn);
}  // namespace rlp

}  // namespace blockforge
