// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <memory>

namespace blockforge {

//! \brief Shared cancellation flag: every copy of a token observes (and can raise) the same signal
class CancellationToken {
  public:
    CancellationToken() : cancelled_{std::make_shared<std::atomic_bool>(false)} {}

    bool is_cancelled() const { return cancelled_->load(std::memory_order_acquire); }

    void signal_cancellation() { cancelled_->store(true, std::memory_order_release); }

    //! Number of tokens sharing this cancellation state
    long use_count() const { return cancelled_.use_count(); }

    //! Whether two tokens share the same cancellation state
    bool shares_state_with(const CancellationToken& other) const { return cancelled_ == other.cancelled_; }

  private:
    std::shared_ptr<std::atomic_bool> cancelled_;
};

}  // namespace blockforge
