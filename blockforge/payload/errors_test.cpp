// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <absl/strings/match.h>
#include <catch2/catch_test_macros.hpp>

namespace blockforge::payload {

static_assert(ComposableError<PayloadBuilderError>);
static_assert(!ComposableError<AttributesError>);

TEST_CASE("PayloadBuilderError messages", "[blockforge][payload][errors]") {
    CHECK(PayloadBuilderError::missing_payload().to_string() == "MissingPayload: missing payload");
    CHECK(PayloadBuilderError::missing_parent_header("0xabcd").message() == "missing parent header 0xabcd");
    CHECK(error_message(PayloadBuilderError::internal("boom")) == "Internal: boom");
}

TEST_CASE("PayloadBuilderError both_failed keeps both causes", "[blockforge][payload][errors]") {
    const auto error{PayloadBuilderError::both_failed(PayloadBuilderError::internal("left"),
                                                      PayloadBuilderError::missing_payload())};
    CHECK(error.code() == PayloadBuilderError::Code::kBothBuildersFailed);
    CHECK(absl::StrContains(error.message(), "Internal: left"));
    CHECK(absl::StrContains(error.message(), "MissingPayload: missing payload"));
    REQUIRE(error.left_cause());
    REQUIRE(error.right_cause());
    CHECK(*error.left_cause() == PayloadBuilderError::internal("left"));
    CHECK(*error.right_cause() == PayloadBuilderError::missing_payload());
    CHECK_FALSE(PayloadBuilderError::internal("x").left_cause());
}

TEST_CASE("AttributesError streams its code", "[blockforge][payload][errors]") {
    const AttributesError error{AttributesError::Code::kMissingGasLimit, "gas limit required"};
    CHECK(error_message(error) == "MissingGasLimit: gas limit required");
}

}  // namespace blockforge::payload
