// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "settings.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <blockforge/core/common/base.hpp>

namespace blockforge::payload::job {

TEST_CASE("PayloadJobSettings validation", "[blockforge][payload][job]") {
    PayloadJobSettings settings;
    CHECK_NOTHROW(settings.validate());

    SECTION("extra data too long") {
        settings.extra_data = Bytes(kMaxExtraDataBytes + 1, 0);
        CHECK_THROWS_AS(settings.validate(), std::invalid_argument);
    }
    SECTION("deadline not after interval") {
        settings.deadline = settings.interval;
        CHECK_THROWS_AS(settings.validate(), std::invalid_argument);
    }
    SECTION("zero interval") {
        settings.interval = 0ms;
        CHECK_THROWS_AS(settings.validate(), std::invalid_argument);
    }
    SECTION("no jobs allowed") {
        settings.max_payload_jobs = 0;
        CHECK_THROWS_AS(settings.validate(), std::invalid_argument);
    }
    SECTION("zero gas limit") {
        settings.gas_limit = 0;
        CHECK_THROWS_AS(settings.validate(), std::invalid_argument);
    }
}

}  // namespace blockforge::payload::job
