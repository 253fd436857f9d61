// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <blockforge/core/rlp/encode.hpp>

namespace blockforge {

Hash BlockHeader::hash() const {
    Bytes encoded;
    rlp::encode(encoded, *this);
    return keccak_hash(encoded);
}

Hash transactions_commitment(const std::vector<Bytes>& transactions) {
    if (transactions.empty()) {
        return Hash{kEmptyRoot};
    }
    std::vector<Hash> hashes;
    hashes.reserve(transactions.size());
    for (const auto& envelope : transactions) {
        hashes.push_back(keccak_hash(envelope));
    }
    Bytes encoded;
    rlp::encode_list(encoded, hashes, [](Bytes& to, const Hash& h) { rlp::encode(to, h); });
    return keccak_hash(encoded);
}

namespace rlp {

    static Header rlp_header(const BlockHeader& header) {
        Header rlp_head{.list = true};
        rlp_head.payload_length += kHashLength + 1;                                        // parent_hash
        rlp_head.payload_length += kHashLength + 1;                                        // ommers_hash
        rlp_head.payload_length += kAddressLength + 1;                                     // beneficiary
        rlp_head.payload_length += kHashLength + 1;                                        // state_root
        rlp_head.payload_length += kHashLength + 1;                                        // transactions_root
        rlp_head.payload_length += kHashLength + 1;                                        // receipts_root
        rlp_head.payload_length += kBloomByteLength + length_of_length(kBloomByteLength);  // logs_bloom
        rlp_head.payload_length += length(header.difficulty);                              // difficulty
        rlp_head.payload_length += length(header.number);                                  // block height
        rlp_head.payload_length += length(header.gas_limit);                               // gas_limit
        rlp_head.payload_length += length(header.gas_used);                                // gas_used
        rlp_head.payload_length += length(header.timestamp);                               // timestamp
        rlp_head.payload_length += length(ByteView{header.extra_data});                    // extra_data
        rlp_head.payload_length += kHashLength + 1;                                        // prev_randao
        rlp_head.payload_length += 8 + 1;                                                  // nonce
        if (header.base_fee_per_gas) {
            rlp_head.payload_length += length(*header.base_fee_per_gas);
        }
        if (header.withdrawals_root) {
            rlp_head.payload_length += kHashLength + 1;
        }
        if (header.parent_beacon_block_root) {
            rlp_head.payload_length += length(uint64_t{0}) * 2;  // blob_gas_used, excess_blob_gas
            rlp_head.payload_length += kHashLength + 1;
        }
        return rlp_head;
    }

    void encode(Bytes& to, const BlockHeader& header) {
        encode_header(to, rlp_header(header));
        encode(to, header.parent_hash);
        encode(to, header.ommers_hash);
        encode(to, header.beneficiary);
        encode(to, header.state_root);
        encode(to, header.transactions_root);
        encode(to, header.receipts_root);
        encode(to, ByteView{header.logs_bloom});
        encode(to, header.difficulty);
        encode(to, header.number);
        encode(to, header.gas_limit);
        encode(to, header.gas_used);
        encode(to, header.timestamp);
        encode(to, ByteView{header.extra_data});
        encode(to, header.prev_randao);
        encode(to, ByteView{header.nonce});
        if (header.base_fee_per_gas) {
            encode(to, *header.base_fee_per_gas);
        }
        if (header.withdrawals_root) {
            encode(to, *header.withdrawals_root);
        }
        if (header.parent_beacon_block_root) {
            // No blob transactions are built, so blob gas accounting is always zero
            encode(to, uint64_t{0});
            encode(to, uint64_t{0});
            encode(to, *header.parent_beacon_block_root);
        }
    }

}  // namespace rlp

}  // namespace blockforge
