// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

#include <blockforge/core/common/endian.hpp>

namespace blockforge::rlp {

static tl::expected<size_t, DecodingError> decode_long_length(ByteView& from, size_t len_of_len) noexcept {
    if (from.size() < len_of_len) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    uint64_t len{0};
    if (DecodingResult res{endian::from_big_compact(from.substr(0, len_of_len), len)}; !res) {
        return tl::unexpected{res.error()};
    }
    from.remove_prefix(len_of_len);
    if (len < 56) {
        return tl::unexpected{DecodingError::kNonCanonicalSize};
    }
    return static_cast<size_t>(len);
}

tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    Header h{.list = false};
    const uint8_t b{from[0]};
    if (b < 0x80) {
        h.payload_length = 1;
    } else if (b < 0xB8) {
        from.remove_prefix(1);
        h.payload_length = b - 0x80u;
        if (h.payload_length == 1) {
            if (from.empty()) {
                return tl::unexpected{DecodingError::kInputTooShort};
            }
            if (from[0] < 0x80) {
                return tl::unexpected{DecodingError::kNonCanonicalSize};
            }
        }
    } else if (b < 0xC0) {
        from.remove_prefix(1);
        const auto len{decode_long_length(from, b - 0xB7u)};
        if (!len) {
            return tl::unexpected{len.error()};
        }
        h.payload_length = *len;
    } else if (b < 0xF8) {
        from.remove_prefix(1);
        h.list = true;
        h.payload_length = b - 0xC0u;
    } else {
        from.remove_prefix(1);
        h.list = true;
        const auto len{decode_long_length(from, b - 0xF7u)};
        if (!len) {
            return tl::unexpected{len.error()};
        }
        h.payload_length = *len;
    }

    if (from.size() < h.payload_length) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    return h;
}

DecodingResult skip_item(ByteView& from) noexcept {
    const auto h{decode_header(from)};
    if (!h) {
        return tl::unexpected{h.error()};
    }
    from.remove_prefix(h->payload_length);
    return {};
}

tl::expected<ByteView, DecodingError> decode_string(ByteView& from) noexcept {
    const auto h{decode_header(from)};
    if (!h) {
        return tl::unexpected{h.error()};
    }
    if (h->list) {
        return tl::unexpected{DecodingError::kUnexpectedList};
    }
    const ByteView payload{from.substr(0, h->payload_length)};
    from.remove_prefix(h->payload_length);
    return payload;
}

DecodingResult decode(ByteView& from, bool& to) noexcept {
    uint64_t i{0};
    if (DecodingResult res{decode(from, i)}; !res) {
        return res;
    }
    if (i > 1) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    to = i == 1;
    return {};
}

tl::expected<bool, DecodingError> decode_optional_address(ByteView& from, evmc::address& to) noexcept {
    const auto payload{decode_string(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    if (payload->empty()) {
        return false;
    }
    if (payload->size() != kAddressLength) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }
    std::memcpy(to.bytes, payload->data(), kAddressLength);
    return true;
}

DecodingResult decode(ByteView& from, evmc::address& to) noexcept {
    const auto present{decode_optional_address(from, to)};
    if (!present) {
        return tl::unexpected{present.error()};
    }
    if (!*present) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }
    return {};
}

DecodingResult decode(ByteView& from, evmc::bytes32& to) noexcept {
    const auto payload{decode_string(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    if (payload->size() != kHashLength) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }
    std::memcpy(to.bytes, payload->data(), kHashLength);
    return {};
}

}  // namespace blockforge::rlp
