// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <absl/strings/match.h>
#include <catch2/catch_test_macros.hpp>

#include <blockforge/infra/test_util/log.hpp>

namespace blockforge::log {

//! LogBuffer exposing its buffered content
template <Level level>
class LogBufferForTest : public LogBuffer<level> {
  public:
    explicit LogBufferForTest() : LogBuffer<level>() {}
    explicit LogBufferForTest(std::string_view msg, const Args& args) : LogBuffer<level>(msg, args) {}

    std::string content() const { return LogBuffer<level>::ss_.str(); }
};

template <Level level>
static bool buffers_content() {
    auto log_buffer = LogBufferForTest<level>();
    log_buffer << "payload";
    return absl::StrContains(log_buffer.content(), "payload");
}

static std::string prettified_key_value(const std::string& key, const std::string& value) {
    std::string kv_pair{kColorGreen};
    kv_pair.append(key).append(kColorReset).append("=").append(kColorReset).append(kColorWhite).append(value);
    return kv_pair;
}

TEST_CASE("LogBuffer", "[blockforge][infra][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};

    // Keep test output off the terminal
    std::stringstream string_cout, string_cerr;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    test_util::StreamSwap cerr_swap{std::cerr, string_cerr};
    init(Settings{.log_verbosity = Level::kInfo});

    SECTION("verbosity filters levels above the configured one") {
        CHECK_FALSE(buffers_content<Level::kDebug>());
        CHECK_FALSE(buffers_content<Level::kTrace>());
        CHECK(buffers_content<Level::kInfo>());
        CHECK(buffers_content<Level::kWarning>());
        CHECK(buffers_content<Level::kError>());
        CHECK(buffers_content<Level::kCritical>());
        CHECK(buffers_content<Level::kNone>());

        test_util::SetLogVerbosityGuard guard{Level::kError};
        CHECK_FALSE(buffers_content<Level::kWarning>());
        CHECK(buffers_content<Level::kError>());
        CHECK_FALSE(test_verbosity(Level::kInfo));
        CHECK(test_verbosity(Level::kCritical));
    }

    SECTION("default settings keep only lines without severity") {
        init(Settings{});
        CHECK(get_verbosity() == Level::kNone);
        CHECK(buffers_content<Level::kNone>());
        CHECK_FALSE(buffers_content<Level::kCritical>());
        CHECK_FALSE(buffers_content<Level::kInfo>());
    }

    SECTION("thread names appear only when enabled") {
        init(Settings{.log_threads = true, .log_verbosity = Level::kInfo});
        set_thread_name("forge-job");
        auto with_threads = LogBufferForTest<Level::kInfo>();
        with_threads << "test";
        CHECK(absl::StrContains(with_threads.content(), "[forge-job  ]"));

        init(Settings{.log_threads = false, .log_verbosity = Level::kInfo});
        auto without_threads = LogBufferForTest<Level::kInfo>();
        without_threads << "test";
        CHECK_FALSE(absl::StrContains(without_threads.content(), "forge-job"));
    }

    SECTION("output to non-TTY streams is not colorized") {
        const bool is_terminal = is_terminal_stderr();
        LogBufferForTest<Level::kInfo>{"built", {"id", "0x01", "fees", "42"}};  // flushes on dtor
        const auto output{string_cerr.str()};
        CHECK(absl::StrContains(output, "built"));
        CHECK(absl::StrContains(output, "id=0x01") == !is_terminal);
        CHECK(absl::StrContains(output, "fees=42") == !is_terminal);
    }

    SECTION("log_std_out redirects lines to standard output") {
        init(Settings{.log_std_out = true, .log_verbosity = Level::kInfo});
        LogBufferForTest<Level::kWarning>{"redirected", {}};
        CHECK(absl::StrContains(string_cout.str(), "redirected"));
        CHECK_FALSE(absl::StrContains(string_cerr.str(), "redirected"));
    }

    SECTION("log_trim shortens the level tag") {
        init(Settings{.log_nocolor = true, .log_trim = true, .log_verbosity = Level::kInfo});
        LogBufferForTest<Level::kWarning>{"trimmed", {}};
        CHECK(absl::StrContains(string_cerr.str(), "WARN"));
        CHECK_FALSE(absl::StrContains(string_cerr.str(), " WARN "));
    }

    SECTION("log file receives uncolored lines") {
        const auto log_file{std::filesystem::temp_directory_path() / "blockforge_log_test.log"};
        std::filesystem::remove(log_file);
        init(Settings{.log_nocolor = false, .log_verbosity = Level::kInfo, .log_file = log_file.string()});
        LogBufferForTest<Level::kInfo>{"teed", {"key", "value"}};

        std::ifstream in{log_file};
        const std::string file_content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        CHECK(absl::StrContains(file_content, "teed"));
        CHECK(absl::StrContains(file_content, "key=value"));
        CHECK_FALSE(absl::StrContains(file_content, "\x1b["));
        std::filesystem::remove(log_file);
    }

    SECTION("arguments through constructor and accumulator") {
        auto by_ctor = LogBufferForTest<Level::kInfo>("test", {"key1", "value1"});
        CHECK(absl::StrContains(by_ctor.content(), prettified_key_value("key1", "value1")));

        auto by_accumulator = LogBufferForTest<Level::kInfo>();
        by_accumulator << "test" << Args{"key2", "value2"};
        CHECK(absl::StrContains(by_accumulator.content(), prettified_key_value("key2", "value2")));
    }

    SECTION("macros skip evaluation of filtered lines") {
        int evaluations{0};
        auto count = [&]() { return ++evaluations; };
        FORGE_DEBUG << "never evaluated " << count();
        CHECK(evaluations == 0);
        FORGE_INFO << "evaluated " << count();
        CHECK(evaluations == 1);
    }
}

}  // namespace blockforge::log
