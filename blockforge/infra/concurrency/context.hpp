// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace blockforge::concurrency {

//! \brief Asio scheduler running its execution loop on one dedicated thread
//! \details The destructor stops the loop and joins the thread, so leaving scope (by exception too) is always safe
class Context {
  public:
    Context();
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    boost::asio::io_context& ioc() noexcept { return ioc_; }
    boost::asio::io_context::executor_type executor() noexcept { return ioc_.get_executor(); }

    //! Start the execution thread, no-op if already started
    void start(std::string thread_name);

    //! Stop the execution loop. This does *NOT* wait for termination: use \ref join() for that.
    void stop();

    //! Wait for termination of the execution thread
    void join();

    bool is_running() const noexcept { return thread_.joinable(); }

  private:
    boost::asio::io_context ioc_;

    //! The work-tracking executor that keep the asio scheduler running
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;

    std::thread thread_;
};

}  // namespace blockforge::concurrency
