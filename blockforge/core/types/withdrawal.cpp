// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "withdrawal.hpp"

#include <blockforge/core/rlp/encode.hpp>

namespace blockforge {

Hash withdrawals_commitment(const std::vector<Withdrawal>& withdrawals) {
    Bytes encoded;
    rlp::encode(encoded, withdrawals);
    return keccak_hash(encoded);
}

namespace rlp {

    static Header header(const Withdrawal& w) {
        return {
            .list = true,
            .payload_length = length(w.index) + length(w.validator_index) + length(w.address) + length(w.amount),
        };
    }

    size_t length(const Withdrawal& w) {
        const Header h{header(w)};
        return length_of_length(h.payload_length) + h.payload_length;
    }

    void encode(Bytes& to, const Withdrawal& w) {
        encode_header(to, header(w));
        encode(to, w.index);
        encode(to, w.validator_index);
        encode(to, w.address);
        encode(to, w.amount);
    }

    void encode(Bytes& to, const std::vector<Withdrawal>& withdrawals) {
        encode_list(to, withdrawals, [](Bytes& out, const Withdrawal& w) { encode(out, w); });
    }

}  // namespace rlp

}  // namespace blockforge
