// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

// RLP encoding functions as per
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/

#pragma once

#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/common/bytes.hpp>
#include <blockforge/core/common/endian.hpp>

namespace blockforge::rlp {

struct Header {
    bool list{false};
    size_t payload_length{0};
};

inline constexpr uint8_t kEmptyStringCode{0x80};
inline constexpr uint8_t kEmptyListCode{0xC0};

void encode_header(Bytes& to, Header header);

void encode(Bytes& to, ByteView str);

template <UnsignedIntegral T>
void encode(Bytes& to, const T& n) {
    if (n == 0) {
        to.push_back(kEmptyStringCode);
    } else if (n < kEmptyStringCode) {
        to.push_back(static_cast<uint8_t>(n));
    } else {
        const ByteView be{endian::to_big_compact(n)};
        encode_header(to, {.list = false, .payload_length = be.size()});
        to.append(be);
    }
}

void encode(Bytes& to, bool);

inline void encode(Bytes& to, const evmc::address& address) { encode(to, ByteView{address.bytes}); }

inline void encode(Bytes& to, const evmc::bytes32& hash) { encode(to, ByteView{hash.bytes}); }

size_t length_of_length(uint64_t payload_length) noexcept;

size_t length(ByteView) noexcept;

template <UnsignedIntegral T>
size_t length(const T& n) noexcept {
    if (n < kEmptyStringCode) {
        return 1;
    }
    const size_t n_bytes{intx::count_significant_bytes(n)};
    return n_bytes + length_of_length(n_bytes);
}

inline size_t length(bool) noexcept { return 1; }

inline size_t length(const evmc::address&) noexcept { return kAddressLength + 1; }

inline size_t length(const evmc::bytes32&) noexcept { return kHashLength + 1; }

//! Encodes a sequence of items as an RLP list, each item encoded through the provided encoder
template <class T, class Encoder>
void encode_list(Bytes& to, const std::vector<T>& items, Encoder&& encoder) {
    Bytes payload;
    for (const auto& item : items) {
        encoder(payload, item);
    }
    encode_header(to, {.list = true, .payload_length = payload.size()});
    to.append(payload);
}

}  // namespace blockforge::rlp
