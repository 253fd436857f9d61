// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <catch2/catch_test_macros.hpp>

#include <blockforge/core/common/util.hpp>
#include <blockforge/core/rlp/encode.hpp>

namespace blockforge {

using namespace evmc::literals;

static constexpr auto kRecipient{0x5df9b87991262f6ba471f09758cde1c0fc1de734_address};
static constexpr auto kDepositor{0xdeaddeaddeaddeaddeaddeaddeaddeaddead0001_address};

static Transaction dynamic_fee_transaction() {
    return Transaction{
        .type = TransactionType::kDynamicFee,
        .chain_id = 1337,
        .nonce = 12,
        .max_priority_fee_per_gas = 2'000'000'000,
        .max_fee_per_gas = 30'000'000'000,
        .gas_limit = 21'000,
        .to = kRecipient,
        .value = 31337,
        .data = *from_hex("a9059cbb"),
    };
}

static Bytes envelope_of(const Transaction& txn) {
    Bytes out;
    rlp::encode(out, txn);
    return out;
}

//! Wraps hand encoded fields into a legacy list envelope
static Bytes legacy_envelope(const Bytes& fields) {
    Bytes out;
    rlp::encode_header(out, {.list = true, .payload_length = fields.size()});
    out.append(fields);
    return out;
}

TEST_CASE("Decode dynamic fee transaction", "[blockforge][core][transaction]") {
    const Transaction txn{dynamic_fee_transaction()};
    const Bytes envelope{envelope_of(txn)};
    CHECK(envelope[0] == 0x02);

    const auto decoded{decode_transaction(envelope)};
    REQUIRE(decoded);
    CHECK(*decoded == txn);
    CHECK(!decoded->is_deposit());
}

TEST_CASE("Decode access list transaction", "[blockforge][core][transaction]") {
    Transaction txn{dynamic_fee_transaction()};
    txn.type = TransactionType::kAccessList;
    txn.max_priority_fee_per_gas = txn.max_fee_per_gas;

    const auto decoded{decode_transaction(envelope_of(txn))};
    REQUIRE(decoded);
    CHECK(decoded->type == TransactionType::kAccessList);
    CHECK(decoded->max_priority_fee_per_gas == 30'000'000'000);
    CHECK(decoded->max_fee_per_gas == 30'000'000'000);
}

TEST_CASE("Decode legacy transaction", "[blockforge][core][transaction]") {
    SECTION("EIP-155") {
        Transaction txn{dynamic_fee_transaction()};
        txn.type = TransactionType::kLegacy;
        txn.max_priority_fee_per_gas = txn.max_fee_per_gas;

        const Bytes envelope{envelope_of(txn)};
        CHECK(envelope[0] >= rlp::kEmptyListCode);
        const auto decoded{decode_transaction(envelope)};
        REQUIRE(decoded);
        CHECK(decoded->chain_id == 1337);
        CHECK(decoded->max_priority_fee_per_gas == decoded->max_fee_per_gas);
        CHECK(decoded->to == kRecipient);
    }

    SECTION("pre EIP-155") {
        Transaction txn{dynamic_fee_transaction()};
        txn.type = TransactionType::kLegacy;
        txn.chain_id = std::nullopt;
        txn.max_priority_fee_per_gas = txn.max_fee_per_gas;

        const auto decoded{decode_transaction(envelope_of(txn))};
        REQUIRE(decoded);
        CHECK(!decoded->chain_id);
    }

    SECTION("contract creation") {
        Transaction txn{dynamic_fee_transaction()};
        txn.type = TransactionType::kLegacy;
        txn.to = std::nullopt;
        txn.max_priority_fee_per_gas = txn.max_fee_per_gas;

        const auto decoded{decode_transaction(envelope_of(txn))};
        REQUIRE(decoded);
        CHECK(!decoded->to);
    }

    SECTION("invalid v") {
        Bytes fields;
        rlp::encode(fields, uint64_t{0});              // nonce
        rlp::encode(fields, uint64_t{1'000'000'000});  // gas price
        rlp::encode(fields, uint64_t{21'000});         // gas limit
        rlp::encode(fields, kRecipient);
        rlp::encode(fields, uint64_t{0});   // value
        rlp::encode(fields, ByteView{});    // data
        rlp::encode(fields, uint64_t{30});  // v
        rlp::encode(fields, uint64_t{0});   // r
        rlp::encode(fields, uint64_t{0});   // s

        CHECK(decode_transaction(legacy_envelope(fields)).error() == DecodingError::kInvalidVInSignature);
    }
}

TEST_CASE("Decode deposit transaction", "[blockforge][core][transaction]") {
    const Transaction txn{
        .type = TransactionType::kDeposit,
        .gas_limit = 100'000,
        .to = kRecipient,
        .value = 5,
        .source_hash = 0x0000000000000000000000000000000000000000000000000000000000000001_bytes32,
        .from = kDepositor,
        .mint = 1'000'000,
        .is_system_transaction = false,
    };
    const Bytes envelope{envelope_of(txn)};
    CHECK(envelope[0] == 0x7E);

    const auto decoded{decode_transaction(envelope)};
    REQUIRE(decoded);
    CHECK(*decoded == txn);
    CHECK(decoded->is_deposit());

    const auto recovered{RecoveredTransaction::from_envelope(envelope, kRecipient)};
    REQUIRE(recovered);
    CHECK(recovered->sender == kDepositor);
}

TEST_CASE("Decode malformed envelopes", "[blockforge][core][transaction]") {
    CHECK(decode_transaction(ByteView{}).error() == DecodingError::kInputTooShort);
    CHECK(decode_transaction(*from_hex("05c0")).error() == DecodingError::kUnsupportedTransactionType);
    CHECK(decode_transaction(*from_hex("8180")).error() == DecodingError::kUnexpectedString);
    CHECK(decode_transaction(*from_hex("0280")).error() == DecodingError::kUnexpectedString);

    SECTION("trailing bytes") {
        Bytes envelope{envelope_of(dynamic_fee_transaction())};
        envelope.push_back(0x00);
        CHECK(decode_transaction(envelope).error() == DecodingError::kInputTooLong);
    }

    SECTION("truncated") {
        Bytes envelope{envelope_of(dynamic_fee_transaction())};
        envelope.pop_back();
        CHECK(decode_transaction(envelope).error() == DecodingError::kInputTooShort);
    }

    SECTION("extra list elements") {
        Transaction txn{dynamic_fee_transaction()};
        txn.type = TransactionType::kLegacy;
        txn.max_priority_fee_per_gas = txn.max_fee_per_gas;
        const Bytes envelope{envelope_of(txn)};

        ByteView view{envelope};
        const auto header{rlp::decode_header(view)};
        REQUIRE(header);
        Bytes fields{view};
        rlp::encode(fields, uint64_t{1});
        CHECK(decode_transaction(legacy_envelope(fields)).error() == DecodingError::kUnexpectedListElements);
    }
}

TEST_CASE("Recovered transaction", "[blockforge][core][transaction]") {
    const Bytes envelope{envelope_of(dynamic_fee_transaction())};
    const auto recovered{RecoveredTransaction::from_envelope(envelope, kDepositor)};
    REQUIRE(recovered);
    CHECK(recovered->hash == keccak_hash(envelope));
    CHECK(recovered->sender == kDepositor);
    CHECK(recovered->envelope == envelope);

    CHECK(!RecoveredTransaction::from_envelope(Bytes{}));
}

TEST_CASE("Effective tip", "[blockforge][core][transaction]") {
    const Transaction txn{dynamic_fee_transaction()};

    SECTION("capped by the priority fee") {
        CHECK(txn.effective_tip(7'000'000'000) == intx::uint256{2'000'000'000});
    }

    SECTION("capped by the fee cap") {
        CHECK(txn.effective_tip(29'000'000'000) == intx::uint256{1'000'000'000});
        CHECK(txn.effective_tip(30'000'000'000) == intx::uint256{0});
    }

    SECTION("fee cap below base fee") {
        CHECK(!txn.effective_tip(31'000'000'000));
    }

    SECTION("deposits") {
        const Transaction deposit{.type = TransactionType::kDeposit, .gas_limit = 100'000};
        CHECK(deposit.effective_tip(31'000'000'000) == intx::uint256{0});
    }
}

}  // namespace blockforge
