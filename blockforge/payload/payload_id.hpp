// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/common/bytes.hpp>
#include <blockforge/core/types/hash.hpp>
#include <blockforge/core/types/withdrawal.hpp>

namespace blockforge::payload {

//! \brief Accumulates the identified attribute fields and derives the payload id from them
//! \details The id is the first 8 bytes, read big endian, of the Keccak-256 of parent, timestamp (8 bytes big
//! endian), prev randao, fee recipient, then the RLP of the withdrawals and the parent beacon block root when present.
//! Attribute variants append their own fields after those.
class PayloadIdHasher {
  public:
    PayloadIdHasher(const Hash& parent, BlockTime timestamp, const evmc::bytes32& prev_randao,
                    const evmc::address& suggested_fee_recipient);

    PayloadIdHasher& withdrawals(const std::optional<std::vector<Withdrawal>>& withdrawals);
    PayloadIdHasher& parent_beacon_block_root(const std::optional<evmc::bytes32>& root);

    PayloadIdHasher& append(ByteView data);
    PayloadIdHasher& append(uint64_t value);
    PayloadIdHasher& append(bool value);

    PayloadId finalize() const;

  private:
    Bytes preimage_;
};

//! Engine API rendering of a payload id: 0x-prefixed 8 bytes in hex
std::string payload_id_to_hex(PayloadId id);

}  // namespace blockforge::payload
