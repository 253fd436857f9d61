// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace blockforge::payload {

//! \brief Failure of a payload build attempt or of an empty payload construction
//! \remarks cancellation is never reported through this type
class PayloadBuilderError {
  public:
    enum class Code {
        kMissingParentHeader,         // the parent header is unknown
        kMissingParentBlock,          // the parent block or its state is unknown
        kChannelClosed,               // the job delivering results went away
        kMissingPayload,              // no payload has been built yet
        kExecutionError,              // a transaction could not be applied
        kWithdrawalBalanceIncrement,  // withdrawals could not be credited
        kInternal,                    // anything else
        kBothBuildersFailed,          // both sides of a builder stack failed
    };

    PayloadBuilderError(Code code, std::string message) : code_{code}, message_{std::move(message)} {}

    static PayloadBuilderError missing_parent_header(std::string_view block_hash);
    static PayloadBuilderError missing_payload();
    static PayloadBuilderError internal(std::string message) { return {Code::kInternal, std::move(message)}; }

    //! Compose two failures into one referencing both
    static PayloadBuilderError both_failed(PayloadBuilderError left, PayloadBuilderError right);

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    //! The failures this one was composed of, nullptr unless code is kBothBuildersFailed
    const PayloadBuilderError* left_cause() const { return left_cause_.get(); }
    const PayloadBuilderError* right_cause() const { return right_cause_.get(); }

    std::string to_string() const;

    friend bool operator==(const PayloadBuilderError& lhs, const PayloadBuilderError& rhs) {
        return lhs.code_ == rhs.code_ && lhs.message_ == rhs.message_;
    }

  private:
    Code code_;
    std::string message_;
    std::shared_ptr<const PayloadBuilderError> left_cause_;
    std::shared_ptr<const PayloadBuilderError> right_cause_;
};

std::string_view to_string(PayloadBuilderError::Code code);

std::ostream& operator<<(std::ostream& out, const PayloadBuilderError& error);

//! Rejection of raw attributes by an attributes type
class AttributesError {
  public:
    enum class Code {
        kMissingWithdrawals,               // withdrawals required after Shanghai
        kUnexpectedWithdrawals,            // withdrawals not allowed before Shanghai
        kMissingParentBeaconBlockRoot,     // beacon root required after Cancun
        kUnexpectedParentBeaconBlockRoot,  // beacon root not allowed before Cancun
        kInvalidTimestamp,                 // timestamp not after the parent's
        kInvalidSequencerTransaction,      // sequencer transaction list is malformed
        kMissingGasLimit,                  // rollup attributes must carry the gas limit
    };

    AttributesError(Code code, std::string message) : code_{code}, message_{std::move(message)} {}

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    friend bool operator==(const AttributesError&, const AttributesError&) = default;

  private:
    Code code_;
    std::string message_;
};

std::string_view to_string(AttributesError::Code code);

std::ostream& operator<<(std::ostream& out, const AttributesError& error);

//! Error types that can compose the failures of both sides of a builder stack
template <class E>
concept ComposableError = requires(E left, E right) {
    { E::both_failed(std::move(left), std::move(right)) } -> std::same_as<E>;
};

//! Render any streamable error for log lines
template <class E>
std::string error_message(const E& error) {
    std::ostringstream out;
    out << error;
    return out.str();
}

}  // namespace blockforge::payload
