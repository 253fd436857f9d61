// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

#include <catch2/catch_test_macros.hpp>

#include <blockforge/core/common/util.hpp>

namespace blockforge::rlp {

using namespace evmc::literals;

template <typename T>
static Bytes encoded(const T& x) {
    Bytes s{};
    encode(s, x);
    return s;
}

TEST_CASE("RLP encoding", "[blockforge][core][rlp]") {
    SECTION("strings") {
        CHECK(to_hex(encoded(ByteView{})) == "80");
        CHECK(to_hex(encoded(ByteView{*from_hex("7B")})) == "7b");
        CHECK(to_hex(encoded(ByteView{*from_hex("80")})) == "8180");
        CHECK(to_hex(encoded(ByteView{*from_hex("ABBA")})) == "82abba");

        const Bytes long_string(56, 0xAA);
        const Bytes out{encoded(ByteView{long_string})};
        CHECK(to_hex(out.substr(0, 2)) == "b838");
        CHECK(out.size() == 58);
        CHECK(length(ByteView{long_string}) == 58);
    }

    SECTION("uint64") {
        CHECK(to_hex(encoded(uint64_t{0})) == "80");
        CHECK(to_hex(encoded(uint64_t{1})) == "01");
        CHECK(to_hex(encoded(uint64_t{0x7F})) == "7f");
        CHECK(to_hex(encoded(uint64_t{0x80})) == "8180");
        CHECK(to_hex(encoded(uint64_t{0x400})) == "820400");
        CHECK(to_hex(encoded(uint64_t{0xFFCCB5})) == "83ffccb5");
        CHECK(to_hex(encoded(uint64_t{0xFFCCB5DDFFEE1483})) == "88ffccb5ddffee1483");

        CHECK(length(uint64_t{0x7F}) == 1);
        CHECK(length(uint64_t{0x80}) == 2);
        CHECK(length(uint64_t{0xFFCCB5DDFFEE1483}) == 9);
    }

    SECTION("uint256") {
        CHECK(to_hex(encoded(intx::uint256{})) == "80");
        CHECK(to_hex(encoded(intx::uint256{0x7F})) == "7f");
        CHECK(to_hex(encoded(intx::uint256{0x400})) == "820400");
        CHECK(to_hex(encoded(intx::from_string<intx::uint256>("0x10203E405060708090A0B0C0D0E0F2"))) ==
              "8f10203e405060708090a0b0c0d0e0f2");
    }

    SECTION("booleans") {
        CHECK(to_hex(encoded(false)) == "80");
        CHECK(to_hex(encoded(true)) == "01");
    }

    SECTION("fixed size strings") {
        const auto address{0x00000000000000000000000000000000000000ff_address};
        CHECK(encoded(address).size() == length(address));
        CHECK(to_hex(encoded(address).substr(0, 1)) == "94");
        const auto hash{0x00000000000000000000000000000000000000000000000000000000000000ff_bytes32};
        CHECK(encoded(hash).size() == length(hash));
        CHECK(to_hex(encoded(hash).substr(0, 1)) == "a0");
    }

    SECTION("lists") {
        Bytes out;
        encode_list(out, std::vector<uint64_t>{}, [](Bytes& to, uint64_t n) { encode(to, n); });
        CHECK(to_hex(out) == "c0");

        out.clear();
        encode_list(out, std::vector<uint64_t>{0xFFCCB5, 0xFFC0B5}, [](Bytes& to, uint64_t n) { encode(to, n); });
        CHECK(to_hex(out) == "c883ffccb583ffc0b5");
    }
}

}  // namespace blockforge::rlp
