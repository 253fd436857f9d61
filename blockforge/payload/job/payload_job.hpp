// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <tl/expected.hpp>

#include <blockforge/chain/chain_client.hpp>
#include <blockforge/chain/transaction_pool.hpp>
#include <blockforge/core/common/overloaded.hpp>
#include <blockforge/infra/common/log.hpp>
#include <blockforge/infra/concurrency/cancellation_token.hpp>
#include <blockforge/payload/build_arguments.hpp>
#include <blockforge/payload/build_outcome.hpp>
#include <blockforge/payload/either.hpp>
#include <blockforge/payload/errors.hpp>
#include <blockforge/payload/job/settings.hpp>
#include <blockforge/payload/payload_builder.hpp>
#include <blockforge/payload/payload_id.hpp>

namespace blockforge::payload::job {

//! \brief Periodic construction of one payload: builds at start, then every interval until the deadline, keeping
//! the best payload and threading the cached reads from one attempt to the next
//! \details Build attempts run on the executor; best_payload() and resolve() may be called from any thread.
//! \warning At least one PayloadJob shared pointer must exist when using it, hence the static create
template <class Builder, class Pool = chain::TransactionPool, class Client = chain::ChainClient>
    requires PayloadBuilder<Builder, Pool, Client>
class PayloadJob : public std::enable_shared_from_this<PayloadJob<Builder, Pool, Client>> {
  public:
    using Attributes = typename Builder::Attributes;
    using Payload = typename Builder::Payload;
    using Error = typename Builder::Error;
    using Arguments = BuildArguments<Pool, Client, Attributes, Payload>;
    //! Left are failures of the job itself, right are failures reported by the builder
    using ResolveError = Either<PayloadBuilderError, Error>;

    static std::shared_ptr<PayloadJob> create(const boost::asio::any_io_executor& executor, Builder builder,
                                              std::shared_ptr<Client> client, std::shared_ptr<Pool> pool,
                                              PayloadConfig<Attributes> config, const PayloadJobSettings& settings) {
        return std::shared_ptr<PayloadJob>{new PayloadJob{executor, std::move(builder), std::move(client),
                                                          std::move(pool), std::move(config), settings}};
    }

    ~PayloadJob() { stop(); }

    PayloadJob(const PayloadJob&) = delete;
    PayloadJob& operator=(const PayloadJob&) = delete;

    //! \brief Start building asynchronously, the first attempt is dispatched right away
    //! \details this call is idempotent
    void start() {
        {
            std::scoped_lock lock{mutex_};
            if (running_ || finished_) return;
            running_ = true;
            deadline_at_ = std::chrono::steady_clock::now() + settings_.deadline;
        }
        boost::asio::post(timer_.get_executor(), [self = this->shared_from_this()]() { self->on_tick(); });
    }

    //! \brief Stop building and cancel the attempt in progress, if any
    //! \details this call is idempotent
    void stop() {
        if (halt()) {
            cancel_.signal_cancellation();
        }
    }

    bool is_running() const {
        std::scoped_lock lock{mutex_};
        return running_;
    }

    PayloadId payload_id() const { return config_.attributes.payload_id(); }
    const PayloadConfig<Attributes>& config() const { return config_; }

    //! The best payload built so far, a kMissingPayload error if no attempt produced one yet
    tl::expected<Payload, PayloadBuilderError> best_payload() const {
        std::scoped_lock lock{mutex_};
        if (!best_payload_) {
            return tl::unexpected{PayloadBuilderError::missing_payload()};
        }
        return *best_payload_;
    }

    //! \brief Stop the job and hand out its payload
    //! \details Without any payload built so far the builder decides: race an empty payload, run a substitute job
    //! or await the attempt in progress (running one more attempt if none is in flight)
    tl::expected<Payload, ResolveError> resolve() {
        halt();
        std::optional<Arguments> args;
        {
            std::scoped_lock lock{mutex_};
            if (best_payload_) {
                Payload best{*best_payload_};
                cancel_.signal_cancellation();
                return best;
            }
            args = Arguments{client_, pool_, cached_reads_, config_, cancel_, std::nullopt};
        }

        using Result = tl::expected<Payload, ResolveError>;
        FORGE_DEBUG_M("PayloadJob") << "resolving " << payload_id_to_hex(payload_id()) << " without payload";
        Result result{std::visit(
            Overloaded{
                [&](AwaitInProgress) -> Result { return await_in_progress(); },
                [&](RaceEmptyPayload) -> Result {
                    cancel_.signal_cancellation();
                    return lift(builder_.build_empty_payload(*client_, config_));
                },
                [&](RacePayload<Payload, Error>&& race) -> Result {
                    cancel_.signal_cancellation();
                    return lift(race.job());
                },
            },
            builder_.on_missing_payload(std::move(*args)))};
        cancel_.signal_cancellation();
        return result;
    }

    //! Number of build attempts performed, cancelled ones included
    size_t attempts() const { return attempts_.load(); }
    //! Number of attempts that produced a better payload
    size_t improvements() const { return improvements_.load(); }

  private:
    PayloadJob(const boost::asio::any_io_executor& executor, Builder builder, std::shared_ptr<Client> client,
               std::shared_ptr<Pool> pool, PayloadConfig<Attributes> config, const PayloadJobSettings& settings)
        : builder_{std::move(builder)},
          client_{std::move(client)},
          pool_{std::move(pool)},
          config_{std::move(config)},
          settings_{settings},
          timer_{executor} {}

    //! Stop scheduling attempts, returning true if the job was running
    bool halt() {
        bool was_running{false};
        {
            std::scoped_lock lock{mutex_};
            was_running = running_;
            running_ = false;
            finished_ = true;
        }
        (void)timer_.cancel();
        return was_running;
    }

    void on_tick() {
        if (!run_attempt(/*forced=*/false)) return;

        std::unique_lock lock{mutex_};
        if (!running_) return;
        if (std::chrono::steady_clock::now() + settings_.interval >= deadline_at_) {
            running_ = false;
            finished_ = true;
            lock.unlock();
            FORGE_DEBUG_M("PayloadJob") << "deadline reached for " << payload_id_to_hex(payload_id())
                                        << " attempts=" << attempts_.load();
            return;
        }
        lock.unlock();
        launch();
    }

    void launch() {
        timer_.expires_after(settings_.interval);
        timer_.async_wait([self = this->shared_from_this()](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            self->on_tick();
        });
    }

    //! Run one build attempt unless the job stopped (when not forced), returning false if no attempt was made
    bool run_attempt(bool forced) {
        std::optional<Arguments> args;
        {
            std::scoped_lock lock{mutex_};
            if (!running_ && !forced) return false;
            in_flight_ = true;
            args = Arguments{client_, pool_, std::move(cached_reads_), config_, cancel_, best_payload_};
            cached_reads_ = CachedReads{};
        }
        ++attempts_;

        auto result{builder_.try_build(std::move(*args))};

        std::scoped_lock lock{mutex_};
        in_flight_ = false;
        if (result) {
            std::visit(Overloaded{
                           [&](Better<Payload>& better) {
                               best_payload_ = std::move(better.payload);
                               cached_reads_ = std::move(better.cached_reads);
                               ++improvements_;
                           },
                           [&](Aborted& aborted) { cached_reads_ = std::move(aborted.cached_reads); },
                           [](Cancelled&) {},
                       },
                       *result);
        } else {
            FORGE_WARN_M("PayloadJob") << "build attempt for " << payload_id_to_hex(payload_id())
                                       << " failed: " << error_message(result.error());
        }
        attempt_done_.notify_all();
        return true;
    }

    tl::expected<Payload, ResolveError> await_in_progress() {
        {
            std::unique_lock lock{mutex_};
            attempt_done_.wait(lock, [&]() { return !in_flight_; });
            if (best_payload_) return *best_payload_;
        }
        run_attempt(/*forced=*/true);
        std::scoped_lock lock{mutex_};
        if (best_payload_) return *best_payload_;
        return tl::unexpected{ResolveError::left(PayloadBuilderError::missing_payload())};
    }

    static tl::expected<Payload, ResolveError> lift(tl::expected<Payload, Error> result) {
        if (!result) {
            return tl::unexpected{ResolveError::right(std::move(result.error()))};
        }
        return std::move(*result);
    }

    const Builder builder_;
    const std::shared_ptr<Client> client_;
    const std::shared_ptr<Pool> pool_;
    const PayloadConfig<Attributes> config_;
    const PayloadJobSettings settings_;
    CancellationToken cancel_;

    boost::asio::steady_timer timer_;
    std::chrono::steady_clock::time_point deadline_at_;

    mutable std::mutex mutex_;
    std::condition_variable attempt_done_;
    bool running_{false};
    bool finished_{false};
    bool in_flight_{false};
    std::optional<Payload> best_payload_;
    CachedReads cached_reads_;

    std::atomic_size_t attempts_{0};
    std::atomic_size_t improvements_{0};
};

}  // namespace blockforge::payload::job
