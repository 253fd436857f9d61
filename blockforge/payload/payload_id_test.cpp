// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "payload_id.hpp"

#include <catch2/catch_test_macros.hpp>

namespace blockforge::payload {

static PayloadIdHasher base_hasher(BlockTime timestamp = 1700000000) {
    return PayloadIdHasher{Hash{0x3b8fb240d288781d4aac94d3fd16809ee413bc99294a085798a589dae51ddd4a_bytes32}, timestamp,
                           evmc::bytes32{}, 0x000000000000000000000000000000000000c0de_address};
}

TEST_CASE("PayloadIdHasher is deterministic", "[blockforge][payload][payload_id]") {
    CHECK(base_hasher().finalize() == base_hasher().finalize());
    CHECK(base_hasher().append(uint64_t{30'000'000}).finalize() == base_hasher().append(uint64_t{30'000'000}).finalize());
}

TEST_CASE("PayloadIdHasher covers every identified field", "[blockforge][payload][payload_id]") {
    const PayloadId id{base_hasher().finalize()};
    CHECK(base_hasher(1700000012).finalize() != id);
    CHECK(base_hasher().parent_beacon_block_root(evmc::bytes32{1}).finalize() != id);
    CHECK(base_hasher().withdrawals(std::vector<Withdrawal>{}).finalize() != id);
    CHECK(base_hasher().append(true).finalize() != base_hasher().append(false).finalize());
    CHECK(base_hasher().append(uint64_t{1}).finalize() != base_hasher().append(uint64_t{2}).finalize());
}

TEST_CASE("PayloadIdHasher ignores absent optional fields", "[blockforge][payload][payload_id]") {
    CHECK(base_hasher().parent_beacon_block_root(std::nullopt).withdrawals(std::nullopt).finalize() ==
          base_hasher().finalize());
}

TEST_CASE("payload_id_to_hex", "[blockforge][payload][payload_id]") {
    CHECK(payload_id_to_hex(0x0123456789abcdef) == "0x0123456789abcdef");
    CHECK(payload_id_to_hex(1) == "0x0000000000000001");
}

}  // namespace blockforge::payload
