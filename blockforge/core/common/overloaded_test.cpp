// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "overloaded.hpp"

#include <string>
#include <variant>

#include <catch2/catch_test_macros.hpp>

namespace blockforge {

TEST_CASE("Overloaded visitor", "[blockforge][core]") {
    const auto describe = Overloaded{
        [](int n) { return "number " + std::to_string(n); },
        [](const std::string& s) { return "text " + s; },
    };

    std::variant<int, std::string> value{7};
    CHECK(std::visit(describe, value) == "number 7");

    value = std::string{"payload"};
    CHECK(std::visit(describe, value) == "text payload");
}

}  // namespace blockforge
