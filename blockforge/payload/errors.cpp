// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <absl/strings/str_cat.h>

namespace blockforge::payload {

PayloadBuilderError PayloadBuilderError::missing_parent_header(std::string_view block_hash) {
    return {Code::kMissingParentHeader, absl::StrCat("missing parent header ", block_hash)};
}

PayloadBuilderError PayloadBuilderError::missing_payload() {
    return {Code::kMissingPayload, "missing payload"};
}

PayloadBuilderError PayloadBuilderError::both_failed(PayloadBuilderError left, PayloadBuilderError right) {
    PayloadBuilderError error{Code::kBothBuildersFailed,
                              absl::StrCat("both builders failed: left: ", left.to_string(), ", right: ", right.to_string())};
    error.left_cause_ = std::make_shared<const PayloadBuilderError>(std::move(left));
    error.right_cause_ = std::make_shared<const PayloadBuilderError>(std::move(right));
    return error;
}

std::string PayloadBuilderError::to_string() const {
    return absl::StrCat(payload::to_string(code_), ": ", message_);
}

std::string_view to_string(PayloadBuilderError::Code code) {
    using Code = PayloadBuilderError::Code;
    switch (code) {
        case Code::kMissingParentHeader:
            return "MissingParentHeader";
        case Code::kMissingParentBlock:
            return "MissingParentBlock";
        case Code::kChannelClosed:
            return "ChannelClosed";
        case Code::kMissingPayload:
            return "MissingPayload";
        case Code::kExecutionError:
            return "ExecutionError";
        case Code::kWithdrawalBalanceIncrement:
            return "WithdrawalBalanceIncrement";
        case Code::kInternal:
            return "Internal";
        case Code::kBothBuildersFailed:
            return "BothBuildersFailed";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, const PayloadBuilderError& error) {
    out << error.to_string();
    return out;
}

std::string_view to_string(AttributesError::Code code) {
    using Code = AttributesError::Code;
    switch (code) {
        case Code::kMissingWithdrawals:
            return "MissingWithdrawals";
        case Code::kUnexpectedWithdrawals:
            return "UnexpectedWithdrawals";
        case Code::kMissingParentBeaconBlockRoot:
            return "MissingParentBeaconBlockRoot";
        case Code::kUnexpectedParentBeaconBlockRoot:
            return "UnexpectedParentBeaconBlockRoot";
        case Code::kInvalidTimestamp:
            return "InvalidTimestamp";
        case Code::kInvalidSequencerTransaction:
            return "InvalidSequencerTransaction";
        case Code::kMissingGasLimit:
            return "MissingGasLimit";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, const AttributesError& error) {
    out << to_string(error.code()) << ": " << error.message();
    return out;
}

}  // namespace blockforge::payload
