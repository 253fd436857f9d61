// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

#include <blockforge/core/common/bytes.hpp>

namespace blockforge::payload::job {

using namespace std::chrono_literals;

//! Configuration of the payload jobs started on behalf of the engine API
struct PayloadJobSettings {
    //! Time between two build attempts of the same job
    std::chrono::milliseconds interval{1s};
    //! Time after which a job stops building, counted from its start
    std::chrono::milliseconds deadline{12s};
    //! Maximum number of jobs kept at the same time, the oldest job is dropped beyond it
    size_t max_payload_jobs{16};
    //! Extra data of built block headers
    Bytes extra_data;
    //! Gas limit of built blocks, the parent's one if not set
    std::optional<uint64_t> gas_limit;

    //! \throws std::invalid_argument if settings are inconsistent
    void validate() const;
};

}  // namespace blockforge::payload::job
