// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "attributes.hpp"

#include <string>
#include <utility>

#include <blockforge/payload/payload_id.hpp>

namespace blockforge::payload::optimism {

static std::string to_string(DecodingError error) {
    switch (error) {
        case DecodingError::kOverflow:
            return "overflow";
        case DecodingError::kLeadingZero:
            return "leading zero";
        case DecodingError::kInputTooShort:
            return "input too short";
        case DecodingError::kInputTooLong:
            return "input too long";
        case DecodingError::kNonCanonicalSize:
            return "non-canonical size";
        case DecodingError::kUnexpectedList:
            return "unexpected list";
        case DecodingError::kUnexpectedString:
            return "unexpected string";
        case DecodingError::kUnexpectedListElements:
            return "unexpected list elements";
        case DecodingError::kInvalidVInSignature:
            return "invalid v in signature";
        case DecodingError::kUnsupportedTransactionType:
            return "unsupported transaction type";
    }
    return "unknown";
}

tl::expected<OpPayloadAttributes, AttributesError> OpPayloadAttributes::try_new(const Hash& parent,
                                                                                const RawOpPayloadAttributes& raw) {
    using Code = AttributesError::Code;
    if (auto valid{ethereum::validate_attributes(raw.payload_attributes)}; !valid) {
        return tl::unexpected{std::move(valid.error())};
    }
    if (!raw.gas_limit || *raw.gas_limit == 0) {
        return tl::unexpected{AttributesError{Code::kMissingGasLimit, "gas limit required"}};
    }

    std::vector<RecoveredTransaction> sequencer_transactions;
    if (raw.transactions) {
        sequencer_transactions.reserve(raw.transactions->size());
        for (size_t i{0}; i < raw.transactions->size(); ++i) {
            auto recovered{RecoveredTransaction::from_envelope((*raw.transactions)[i])};
            if (!recovered) {
                return tl::unexpected{AttributesError{
                    Code::kInvalidSequencerTransaction,
                    "sequencer transaction " + std::to_string(i) + ": " + to_string(recovered.error())}};
            }
            sequencer_transactions.push_back(std::move(*recovered));
        }
    }
    return OpPayloadAttributes{parent, raw, std::move(sequencer_transactions)};
}

OpPayloadAttributes::OpPayloadAttributes(const Hash& parent, const RawOpPayloadAttributes& raw,
                                         std::vector<RecoveredTransaction> sequencer_transactions)
    : parent_{parent},
      fields_{raw.payload_attributes},
      sequencer_transactions_{std::move(sequencer_transactions)},
      no_tx_pool_{raw.no_tx_pool},
      gas_limit_{*raw.gas_limit} {
    PayloadIdHasher hasher{parent_, fields_.timestamp, fields_.prev_randao, fields_.suggested_fee_recipient};
    hasher.withdrawals(fields_.withdrawals).parent_beacon_block_root(fields_.parent_beacon_block_root);
    if (no_tx_pool_ || !sequencer_transactions_.empty()) {
        hasher.append(no_tx_pool_);
        hasher.append(static_cast<uint64_t>(sequencer_transactions_.size()));
        for (const auto& txn : sequencer_transactions_) {
            hasher.append(ByteView{txn.hash.bytes});
        }
    }
    hasher.append(gas_limit_);
    id_ = hasher.finalize();
}

}  // namespace blockforge::payload::optimism
