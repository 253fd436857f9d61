// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <blockforge/core/rlp/decode.hpp>
#include <blockforge/core/rlp/encode.hpp>

namespace blockforge {

std::optional<intx::uint256> Transaction::effective_tip(const intx::uint256& base_fee) const {
    if (is_deposit()) {
        return intx::uint256{0};
    }
    if (max_fee_per_gas < base_fee) {
        return std::nullopt;
    }
    const intx::uint256 max_tip{max_fee_per_gas - base_fee};
    return max_priority_fee_per_gas < max_tip ? max_priority_fee_per_gas : max_tip;
}

namespace {

    DecodingResult decode_bytes(ByteView& from, Bytes& to) noexcept {
        const auto payload{rlp::decode_string(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        to = *payload;
        return {};
    }

    DecodingResult decode_recipient(ByteView& from, std::optional<evmc::address>& to) noexcept {
        evmc::address address;
        const auto present{rlp::decode_optional_address(from, address)};
        if (!present) {
            return tl::unexpected{present.error()};
        }
        to = *present ? std::make_optional(address) : std::nullopt;
        return {};
    }

    DecodingResult skip_list(ByteView& from) noexcept {
        const auto h{rlp::decode_header(from)};
        if (!h) {
            return tl::unexpected{h.error()};
        }
        if (!h->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }
        from.remove_prefix(h->payload_length);
        return {};
    }

    DecodingResult skip_signature(ByteView& from) noexcept {
        for (int i{0}; i < 3; ++i) {
            intx::uint256 word;
            if (DecodingResult res{rlp::decode(from, word)}; !res) {
                return res;
            }
        }
        return {};
    }

    DecodingResult decode_legacy(ByteView& from, Transaction& txn) noexcept {
        if (DecodingResult res{rlp::decode(from, txn.nonce)}; !res) {
            return res;
        }
        if (DecodingResult res{rlp::decode(from, txn.max_fee_per_gas)}; !res) {
            return res;
        }
        txn.max_priority_fee_per_gas = txn.max_fee_per_gas;
        if (DecodingResult res{rlp::decode(from, txn.gas_limit)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_recipient(from, txn.to)}; !res) {
            return res;
        }
        if (DecodingResult res{rlp::decode(from, txn.value)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_bytes(from, txn.data)}; !res) {
            return res;
        }

        intx::uint256 v;
        if (DecodingResult res{rlp::decode(from, v)}; !res) {
            return res;
        }
        if (v == 27 || v == 28) {
            txn.chain_id = std::nullopt;
        } else if (v >= 35) {
            txn.chain_id = static_cast<uint64_t>((v - 35) >> 1);
        } else {
            return tl::unexpected{DecodingError::kInvalidVInSignature};
        }
        for (int i{0}; i < 2; ++i) {
            intx::uint256 word;
            if (DecodingResult res{rlp::decode(from, word)}; !res) {
                return res;
            }
        }
        return {};
    }

    DecodingResult decode_typed(ByteView& from, Transaction& txn) noexcept {
        uint64_t chain_id{0};
        if (DecodingResult res{rlp::decode(from, chain_id)}; !res) {
            return res;
        }
        txn.chain_id = chain_id;
        if (DecodingResult res{rlp::decode(from, txn.nonce)}; !res) {
            return res;
        }
        if (txn.type == TransactionType::kAccessList) {
            if (DecodingResult res{rlp::decode(from, txn.max_fee_per_gas)}; !res) {
                return res;
            }
            txn.max_priority_fee_per_gas = txn.max_fee_per_gas;
        } else {
            if (DecodingResult res{rlp::decode(from, txn.max_priority_fee_per_gas)}; !res) {
                return res;
            }
            if (DecodingResult res{rlp::decode(from, txn.max_fee_per_gas)}; !res) {
                return res;
            }
        }
        if (DecodingResult res{rlp::decode(from, txn.gas_limit)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_recipient(from, txn.to)}; !res) {
            return res;
        }
        if (DecodingResult res{rlp::decode(from, txn.value)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_bytes(from, txn.data)}; !res) {
            return res;
        }
        if (DecodingResult res{skip_list(from)}; !res) {  // access list
            return res;
        }
        if (txn.type == TransactionType::kBlob) {
            if (!txn.to) {
                return tl::unexpected{DecodingError::kUnexpectedString};  // blob transactions cannot create contracts
            }
            intx::uint256 max_fee_per_blob_gas;
            if (DecodingResult res{rlp::decode(from, max_fee_per_blob_gas)}; !res) {
                return res;
            }
            if (DecodingResult res{skip_list(from)}; !res) {  // blob versioned hashes
                return res;
            }
        }
        return skip_signature(from);
    }

    DecodingResult decode_deposit(ByteView& from, Transaction& txn) noexcept {
        evmc::bytes32 source_hash;
        if (DecodingResult res{rlp::decode(from, source_hash)}; !res) {
            return res;
        }
        txn.source_hash = source_hash;
        evmc::address sender;
        if (DecodingResult res{rlp::decode(from, sender)}; !res) {
            return res;
        }
        txn.from = sender;
        if (DecodingResult res{decode_recipient(from, txn.to)}; !res) {
            return res;
        }
        if (DecodingResult res{rlp::decode(from, txn.mint)}; !res) {
            return res;
        }
        if (DecodingResult res{rlp::decode(from, txn.value)}; !res) {
            return res;
        }
        if (DecodingResult res{rlp::decode(from, txn.gas_limit)}; !res) {
            return res;
        }
        if (DecodingResult res{rlp::decode(from, txn.is_system_transaction)}; !res) {
            return res;
        }
        return decode_bytes(from, txn.data);
    }

    std::optional<TransactionType> typed_envelope_type(uint8_t type) {
        switch (static_cast<TransactionType>(type)) {
            case TransactionType::kAccessList:
            case TransactionType::kDynamicFee:
            case TransactionType::kBlob:
            case TransactionType::kDeposit:
                return static_cast<TransactionType>(type);
            default:
                return std::nullopt;
        }
    }

}  // namespace

tl::expected<Transaction, DecodingError> decode_transaction(ByteView envelope) noexcept {
    if (envelope.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    Transaction txn;
    if (envelope[0] >= rlp::kEmptyListCode) {
        txn.type = TransactionType::kLegacy;
    } else if (envelope[0] < rlp::kEmptyStringCode) {
        const auto type{typed_envelope_type(envelope[0])};
        if (!type) {
            return tl::unexpected{DecodingError::kUnsupportedTransactionType};
        }
        txn.type = *type;
        envelope.remove_prefix(1);
    } else {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }

    const auto header{rlp::decode_header(envelope)};
    if (!header) {
        return tl::unexpected{header.error()};
    }
    if (!header->list) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }
    if (envelope.size() > header->payload_length) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }

    ByteView fields{envelope.substr(0, header->payload_length)};
    DecodingResult res;
    switch (txn.type) {
        case TransactionType::kLegacy:
            res = decode_legacy(fields, txn);
            break;
        case TransactionType::kDeposit:
            res = decode_deposit(fields, txn);
            break;
        default:
            res = decode_typed(fields, txn);
            break;
    }
    if (!res) {
        return tl::unexpected{res.error()};
    }
    if (!fields.empty()) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }
    return txn;
}

tl::expected<RecoveredTransaction, DecodingError> RecoveredTransaction::from_envelope(Bytes envelope,
                                                                                     const evmc::address& sender) {
    auto txn{decode_transaction(envelope)};
    if (!txn) {
        return tl::unexpected{txn.error()};
    }
    RecoveredTransaction recovered{
        .transaction = std::move(*txn),
        .envelope = std::move(envelope),
    };
    recovered.hash = keccak_hash(recovered.envelope);
    recovered.sender = recovered.transaction.from.value_or(sender);
    return recovered;
}

namespace rlp {

    static void encode_recipient(Bytes& to, const std::optional<evmc::address>& recipient) {
        if (recipient) {
            encode(to, *recipient);
        } else {
            encode(to, ByteView{});
        }
    }

    static void encode_zero_signature(Bytes& to) {
        encode(to, uint64_t{0});  // y parity
        encode(to, uint64_t{0});  // r
        encode(to, uint64_t{0});  // s
    }

    static void encode_fields(Bytes& to, const Transaction& txn) {
        switch (txn.type) {
            case TransactionType::kLegacy:
                encode(to, txn.nonce);
                encode(to, txn.max_fee_per_gas);
                encode(to, txn.gas_limit);
                encode_recipient(to, txn.to);
                encode(to, txn.value);
                encode(to, ByteView{txn.data});
                encode(to, txn.chain_id ? intx::uint256{*txn.chain_id} * 2 + 35 : intx::uint256{27});
                encode(to, uint64_t{0});  // r
                encode(to, uint64_t{0});  // s
                break;
            case TransactionType::kDeposit:
                encode(to, txn.source_hash.value_or(evmc::bytes32{}));
                encode(to, txn.from.value_or(evmc::address{}));
                encode_recipient(to, txn.to);
                encode(to, txn.mint);
                encode(to, txn.value);
                encode(to, txn.gas_limit);
                encode(to, txn.is_system_transaction);
                encode(to, ByteView{txn.data});
                break;
            default:
                encode(to, txn.chain_id.value_or(0));
                encode(to, txn.nonce);
                if (txn.type == TransactionType::kAccessList) {
                    encode(to, txn.max_fee_per_gas);
                } else {
                    encode(to, txn.max_priority_fee_per_gas);
                    encode(to, txn.max_fee_per_gas);
                }
                encode(to, txn.gas_limit);
                encode_recipient(to, txn.to);
                encode(to, txn.value);
                encode(to, ByteView{txn.data});
                encode_header(to, {.list = true, .payload_length = 0});  // access list
                if (txn.type == TransactionType::kBlob) {
                    encode(to, uint64_t{0});                                 // max fee per blob gas
                    encode_header(to, {.list = true, .payload_length = 0});  // blob versioned hashes
                }
                encode_zero_signature(to);
                break;
        }
    }

    void encode(Bytes& to, const Transaction& txn) {
        Bytes fields;
        encode_fields(fields, txn);
        if (txn.type != TransactionType::kLegacy) {
            to.push_back(static_cast<uint8_t>(txn.type));
        }
        encode_header(to, {.list = true, .payload_length = fields.size()});
        to.append(fields);
    }

}  // namespace rlp

}  // namespace blockforge
