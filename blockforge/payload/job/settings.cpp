// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "settings.hpp"

#include <string>

#include <blockforge/core/common/base.hpp>
#include <blockforge/infra/common/ensure.hpp>

namespace blockforge::payload::job {

void PayloadJobSettings::validate() const {
    ensure_pre_condition(extra_data.size() <= kMaxExtraDataBytes, [&]() {
        return "extra data is " + std::to_string(extra_data.size()) + " bytes, at most " +
               std::to_string(kMaxExtraDataBytes) + " allowed";
    });
    ensure_pre_condition(interval.count() > 0, []() { return std::string{"interval must be positive"}; });
    ensure_pre_condition(deadline > interval, [&]() {
        return "deadline " + std::to_string(deadline.count()) + "ms must exceed interval " +
               std::to_string(interval.count()) + "ms";
    });
    ensure_pre_condition(max_payload_jobs > 0, []() { return std::string{"at least one payload job must be allowed"}; });
    ensure_pre_condition(!gas_limit || *gas_limit > 0, []() { return std::string{"gas limit must be positive"}; });
}

}  // namespace blockforge::payload::job
