// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include <blockforge/infra/concurrency/cancellation_token.hpp>
#include <blockforge/payload/attributes.hpp>
#include <blockforge/payload/cached_reads.hpp>

namespace blockforge::payload {

//! \brief Everything a single build attempt needs
//! \remarks client and pool are shared handles, cancel shares its state with every copy, cached_reads belongs to
//! this attempt and is handed back through the outcome
template <class Pool, class Client, class A, class P>
struct BuildArguments {
    std::shared_ptr<Client> client;
    std::shared_ptr<Pool> pool;
    CachedReads cached_reads;
    PayloadConfig<A> config;
    CancellationToken cancel;
    std::optional<P> best_payload;
};

}  // namespace blockforge::payload
