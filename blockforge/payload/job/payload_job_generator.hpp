// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <tl/expected.hpp>

#include <blockforge/core/common/hash_maps.hpp>
#include <blockforge/infra/common/log.hpp>
#include <blockforge/payload/either.hpp>
#include <blockforge/payload/errors.hpp>
#include <blockforge/payload/job/payload_job.hpp>
#include <blockforge/payload/job/settings.hpp>
#include <blockforge/payload/payload_id.hpp>

namespace blockforge::payload::job {

//! \brief Creates payload jobs from engine API attributes and keeps them by payload id
//! \remarks at most max_payload_jobs are kept, starting a job beyond that stops and drops the oldest one
template <class Builder, class Pool = chain::TransactionPool, class Client = chain::ChainClient>
class PayloadJobGenerator {
  public:
    using Job = PayloadJob<Builder, Pool, Client>;
    using Attributes = typename Builder::Attributes;
    using Payload = typename Builder::Payload;
    //! Left are rejected attributes, right are failures preparing the job
    using NewJobError = Either<AttributesErrorOf<Attributes>, PayloadBuilderError>;

    PayloadJobGenerator(boost::asio::any_io_executor executor, Builder builder, std::shared_ptr<Client> client,
                        std::shared_ptr<Pool> pool, PayloadJobSettings settings)
        : executor_{std::move(executor)},
          builder_{std::move(builder)},
          client_{std::move(client)},
          pool_{std::move(pool)},
          settings_{std::move(settings)} {}

    ~PayloadJobGenerator() { stop_all(); }

    PayloadJobGenerator(const PayloadJobGenerator&) = delete;
    PayloadJobGenerator& operator=(const PayloadJobGenerator&) = delete;

    //! \brief Validate the attributes and start a job building on the given parent
    //! \return the payload id, also when a job with the same id is already running
    tl::expected<PayloadId, NewJobError> new_payload_job(const Hash& parent, const RawAttributesOf<Attributes>& raw) {
        auto attributes{Attributes::try_new(parent, raw)};
        if (!attributes) {
            return tl::unexpected{NewJobError::left(std::move(attributes.error()))};
        }
        const PayloadId id{attributes->payload_id()};

        std::scoped_lock lock{mutex_};
        if (jobs_.contains(id)) {
            return id;
        }
        auto parent_header{client_->sealed_header(parent)};
        if (!parent_header) {
            return tl::unexpected{NewJobError::right(PayloadBuilderError::missing_parent_header(parent.to_hex()))};
        }
        if (attributes->timestamp() <= parent_header->header().timestamp) {
            return tl::unexpected{NewJobError::right(
                PayloadBuilderError::internal("attributes timestamp not after parent timestamp"))};
        }

        PayloadConfig<Attributes> config{
            .parent_header = std::move(parent_header),
            .extra_data = settings_.extra_data,
            .attributes = std::move(*attributes),
        };
        auto job{Job::create(executor_, builder_, client_, pool_, std::move(config), settings_)};
        while (jobs_.size() >= settings_.max_payload_jobs && !order_.empty()) {
            evict_oldest();
        }
        jobs_.emplace(id, job);
        order_.push_back(id);
        job->start();
        log::Info("Payload job started", {"id", payload_id_to_hex(id), "parent", parent.to_hex()});
        return id;
    }

    //! The job building the given payload, nullptr if unknown
    std::shared_ptr<Job> job(PayloadId id) const {
        std::scoped_lock lock{mutex_};
        const auto it{jobs_.find(id)};
        return it != jobs_.end() ? it->second : nullptr;
    }

    //! \brief Resolve the job building the given payload and forget it
    //! \return the resolved payload, a left kMissingPayload error if the job is unknown
    tl::expected<Payload, typename Job::ResolveError> resolve(PayloadId id) {
        std::shared_ptr<Job> job;
        {
            std::scoped_lock lock{mutex_};
            const auto it{jobs_.find(id)};
            if (it == jobs_.end()) {
                return tl::unexpected{Job::ResolveError::left(PayloadBuilderError::missing_payload())};
            }
            job = std::move(it->second);
            jobs_.erase(it);
            std::erase(order_, id);
        }
        return job->resolve();
    }

    size_t size() const {
        std::scoped_lock lock{mutex_};
        return jobs_.size();
    }

    void stop_all() {
        std::scoped_lock lock{mutex_};
        for (auto& [_, job] : jobs_) {
            job->stop();
        }
        jobs_.clear();
        order_.clear();
    }

  private:
    void evict_oldest() {
        const PayloadId oldest{order_.front()};
        order_.pop_front();
        const auto it{jobs_.find(oldest)};
        if (it == jobs_.end()) return;
        it->second->stop();
        jobs_.erase(it);
        FORGE_DEBUG_M("PayloadJobGenerator") << "dropped payload job " << payload_id_to_hex(oldest);
    }

    const boost::asio::any_io_executor executor_;
    const Builder builder_;
    const std::shared_ptr<Client> client_;
    const std::shared_ptr<Pool> pool_;
    const PayloadJobSettings settings_;

    mutable std::mutex mutex_;
    FlatHashMap<PayloadId, std::shared_ptr<Job>> jobs_;
    std::deque<PayloadId> order_;
};

}  // namespace blockforge::payload::job
