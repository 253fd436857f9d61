// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "attributes.hpp"

#include <catch2/catch_test_macros.hpp>

namespace blockforge::payload::ethereum {

static_assert(PayloadAttributes<EthPayloadAttributes>);

static RawPayloadAttributes cancun_attributes() {
    return {
        .version = EngineApiVersion::kV3,
        .timestamp = 1'700'000'012,
        .prev_randao = evmc::bytes32{0x42},
        .suggested_fee_recipient = 0x00000000000000000000000000000000000fee00_address,
        .withdrawals = std::vector<Withdrawal>{},
        .parent_beacon_block_root = evmc::bytes32{0xbeac},
    };
}

static const Hash kParent{evmc::bytes32{0x0a}};

TEST_CASE("EthPayloadAttributes accepts well formed attributes", "[blockforge][payload][ethereum]") {
    const auto attributes{EthPayloadAttributes::try_new(kParent, cancun_attributes())};
    REQUIRE(attributes);
    CHECK(attributes->parent() == kParent);
    CHECK(attributes->timestamp() == 1'700'000'012);
    CHECK(attributes->parent_beacon_block_root() == evmc::bytes32{0xbeac});
    CHECK(attributes->raw() == cancun_attributes());
}

TEST_CASE("EthPayloadAttributes validation per engine API version", "[blockforge][payload][ethereum]") {
    using Code = AttributesError::Code;
    auto raw{cancun_attributes()};

    SECTION("zero timestamp") {
        raw.timestamp = 0;
        CHECK(EthPayloadAttributes::try_new(kParent, raw).error().code() == Code::kInvalidTimestamp);
    }
    SECTION("V3 without beacon root") {
        raw.parent_beacon_block_root.reset();
        CHECK(EthPayloadAttributes::try_new(kParent, raw).error().code() == Code::kMissingParentBeaconBlockRoot);
    }
    SECTION("V3 without withdrawals") {
        raw.withdrawals.reset();
        CHECK(EthPayloadAttributes::try_new(kParent, raw).error().code() == Code::kMissingWithdrawals);
    }
    SECTION("V2 with beacon root") {
        raw.version = EngineApiVersion::kV2;
        CHECK(EthPayloadAttributes::try_new(kParent, raw).error().code() == Code::kUnexpectedParentBeaconBlockRoot);
    }
    SECTION("V1 with withdrawals") {
        raw.version = EngineApiVersion::kV1;
        raw.parent_beacon_block_root.reset();
        CHECK(EthPayloadAttributes::try_new(kParent, raw).error().code() == Code::kUnexpectedWithdrawals);
    }
    SECTION("V1 plain") {
        raw.version = EngineApiVersion::kV1;
        raw.parent_beacon_block_root.reset();
        raw.withdrawals.reset();
        CHECK(EthPayloadAttributes::try_new(kParent, raw));
    }
}

TEST_CASE("EthPayloadAttributes payload id", "[blockforge][payload][ethereum]") {
    const auto id{EthPayloadAttributes::try_new(kParent, cancun_attributes())->payload_id()};
    CHECK(EthPayloadAttributes::try_new(kParent, cancun_attributes())->payload_id() == id);
    CHECK(EthPayloadAttributes::try_new(Hash{evmc::bytes32{0x0b}}, cancun_attributes())->payload_id() != id);

    auto raw{cancun_attributes()};
    raw.withdrawals = std::vector<Withdrawal>{Withdrawal{.index = 1, .validator_index = 2, .address = {}, .amount = 3}};
    CHECK(EthPayloadAttributes::try_new(kParent, raw)->payload_id() != id);

    raw = cancun_attributes();
    raw.suggested_fee_recipient = 0x0000000000000000000000000000000000000001_address;
    CHECK(EthPayloadAttributes::try_new(kParent, raw)->payload_id() != id);
}

}  // namespace blockforge::payload::ethereum
