// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <chrono>
#include <map>
#include <stdexcept>

#include <blockforge/core/common/util.hpp>

namespace blockforge::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_payload_job_options(CLI::App& cli, payload::job::PayloadJobSettings& settings, std::string& extra_data_hex) {
    auto& opts = *cli.add_option_group("Payload", "Payload builder options");

    // CLI11 has no std::chrono support, go through plain milliseconds
    opts.add_option_function<uint64_t>(
            "--builder.interval",
            [&settings](uint64_t ms) { settings.interval = std::chrono::milliseconds{ms}; },
            "Time between two build attempts of a payload job (in milliseconds)")
        ->check(CLI::PositiveNumber)
        ->default_val(settings.interval.count());
    opts.add_option_function<uint64_t>(
            "--builder.deadline",
            [&settings](uint64_t ms) { settings.deadline = std::chrono::milliseconds{ms}; },
            "Time after which a payload job stops building (in milliseconds)")
        ->check(CLI::PositiveNumber)
        ->default_val(settings.deadline.count());
    opts.add_option("--builder.max-tasks", settings.max_payload_jobs, "Maximum number of payload jobs kept at once")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    opts.add_option("--builder.extradata", extra_data_hex, "Extra data of built blocks as hex string (at most 32 bytes)")
        ->capture_default_str();
    opts.add_option_function<uint64_t>(
            "--builder.gaslimit",
            [&settings](uint64_t gas_limit) { settings.gas_limit = gas_limit; },
            "Gas limit of built blocks (default: the parent's one)")
        ->check(CLI::PositiveNumber);
}

void apply_payload_job_options(payload::job::PayloadJobSettings& settings, const std::string& extra_data_hex) {
    if (!extra_data_hex.empty()) {
        const auto extra_data{from_hex(extra_data_hex)};
        if (!extra_data) {
            throw std::invalid_argument{"invalid hex in --builder.extradata: " + extra_data_hex};
        }
        settings.extra_data = *extra_data;
    }
    settings.validate();
}

}  // namespace blockforge::cmd::common
