// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

// RLP decoding functions, limited to what typed transaction envelopes need

#pragma once

#include <cstring>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/common/bytes.hpp>
#include <blockforge/core/common/decoding_result.hpp>
#include <blockforge/core/rlp/encode.hpp>

namespace blockforge::rlp {

// Consumes an RLP header unless it's a single byte in the [0x00, 0x7f] range,
// in which case the byte is put back.
tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept;

//! Consumes one whole item (string or list) without interpreting its payload
DecodingResult skip_item(ByteView& from) noexcept;

//! Consumes a string item and returns a view of its payload
tl::expected<ByteView, DecodingError> decode_string(ByteView& from) noexcept;

template <UnsignedIntegral T>
DecodingResult decode(ByteView& from, T& to) noexcept {
    const auto payload{decode_string(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    return endian::from_big_compact(*payload, to);
}

DecodingResult decode(ByteView& from, bool& to) noexcept;

//! Decodes a fixed size string such as an address or a hash; the empty string is accepted for addresses
//! to express contract creation and is reported through the returned flag
tl::expected<bool, DecodingError> decode_optional_address(ByteView& from, evmc::address& to) noexcept;

DecodingResult decode(ByteView& from, evmc::bytes32& to) noexcept;

DecodingResult decode(ByteView& from, evmc::address& to) noexcept;

}  // namespace blockforge::rlp
