// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "payload_id.hpp"

#include <array>

#include <blockforge/core/common/endian.hpp>
#include <blockforge/core/common/util.hpp>

namespace blockforge::payload {

PayloadIdHasher::PayloadIdHasher(const Hash& parent, BlockTime timestamp, const evmc::bytes32& prev_randao,
                                 const evmc::address& suggested_fee_recipient) {
    preimage_.reserve(3 * kHashLength + kAddressLength);
    append(ByteView{parent.bytes});
    append(timestamp);
    append(ByteView{prev_randao.bytes});
    append(ByteView{suggested_fee_recipient.bytes});
}

PayloadIdHasher& PayloadIdHasher::withdrawals(const std::optional<std::vector<Withdrawal>>& withdrawals) {
    if (withdrawals) {
        rlp::encode(preimage_, *withdrawals);
    }
    return *this;
}

PayloadIdHasher& PayloadIdHasher::parent_beacon_block_root(const std::optional<evmc::bytes32>& root) {
    if (root) {
        append(ByteView{root->bytes});
    }
    return *this;
}

PayloadIdHasher& PayloadIdHasher::append(ByteView data) {
    preimage_.append(data);
    return *this;
}

PayloadIdHasher& PayloadIdHasher::append(uint64_t value) {
    std::array<uint8_t, sizeof(uint64_t)> be{};
    endian::store_big_u64(be.data(), value);
    preimage_.append(be.data(), be.size());
    return *this;
}

PayloadIdHasher& PayloadIdHasher::append(bool value) {
    preimage_.push_back(value ? 1 : 0);
    return *this;
}

PayloadId PayloadIdHasher::finalize() const {
    const ethash::hash256 digest{keccak256(preimage_)};
    return endian::load_big_u64(digest.bytes);
}

std::string payload_id_to_hex(PayloadId id) {
    std::array<uint8_t, sizeof(PayloadId)> be{};
    endian::store_big_u64(be.data(), id);
    return to_hex(ByteView{be.data(), be.size()}, /*with_prefix=*/true);
}

}  // namespace blockforge::payload
