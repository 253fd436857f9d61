// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "context.hpp"

#include <exception>
#include <utility>

#include <blockforge/infra/common/log.hpp>

namespace blockforge::concurrency {

Context::Context() : work_{boost::asio::make_work_guard(ioc_)} {}

Context::~Context() {
    stop();
    join();
}

void Context::start(std::string thread_name) {
    if (thread_.joinable()) return;
    thread_ = std::thread{[this, name = std::move(thread_name)]() {
        log::set_thread_name(name.c_str());
        FORGE_TRACE_M("Context") << "execution loop start";
        try {
            ioc_.run();
        } catch (const std::exception& ex) {
            FORGE_CRIT_M("Context") << "execution loop exception: " << ex.what();
        }
        FORGE_TRACE_M("Context") << "execution loop end";
    }};
}

void Context::stop() {
    work_.reset();
    ioc_.stop();
}

void Context::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace blockforge::concurrency
