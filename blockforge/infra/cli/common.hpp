// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include <blockforge/infra/common/log.hpp>
#include <blockforge/payload/job/settings.hpp>

namespace blockforge::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up options to populate payload job settings after cli.parse()
//! \remarks the extra data option is captured as hex into extra_data_hex, decode it with parse_extra_data
void add_payload_job_options(CLI::App& cli, payload::job::PayloadJobSettings& settings, std::string& extra_data_hex);

//! \brief Decode the hex extra data option into the settings and validate them
//! \throws std::invalid_argument if the hex is malformed or the settings are inconsistent
void apply_payload_job_options(payload::job::PayloadJobSettings& settings, const std::string& extra_data_hex);

}  // namespace blockforge::cmd::common
