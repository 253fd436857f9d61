// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/common/bytes.hpp>

// intx does not include operator<< overloading for uint<N>
namespace intx {

template <unsigned N>
inline std::ostream& operator<<(std::ostream& out, const uint<N>& value) {
    out << "0x" << intx::hex(value);
    return out;
}

}  // namespace intx

namespace blockforge {

//! \brief Strips leftmost zeroed bytes from byte sequence
//! \param [in] data : The view to process
//! \return A new view of the sequence
ByteView zeroless_view(ByteView data);

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

inline std::string to_hex(const evmc::bytes32& value, bool with_prefix = false) {
    return to_hex(ByteView{value.bytes}, with_prefix);
}

inline std::string to_hex(const evmc::address& value, bool with_prefix = false) {
    return to_hex(ByteView{value.bytes}, with_prefix);
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Parses a hex string, with or without 0x prefix, into bytes
//! \remarks An odd number of digits is accepted and left-padded with a zero nibble
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

}  // namespace blockforge
