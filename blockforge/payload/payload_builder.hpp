// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <functional>
#include <variant>

#include <tl/expected.hpp>

#include <blockforge/payload/attributes.hpp>
#include <blockforge/payload/build_arguments.hpp>
#include <blockforge/payload/build_outcome.hpp>
#include <blockforge/payload/built_payload.hpp>

namespace blockforge::payload {

//! Wait for the build already in progress
struct AwaitInProgress {};

//! Race an empty payload against the build in progress
struct RaceEmptyPayload {};

//! Produce a substitute payload with the given job
template <class P, class E>
struct RacePayload {
    std::function<tl::expected<P, E>()> job;
};

//! What to do when a payload is requested before any build attempt produced one
template <class P, class E>
using MissingPayloadBehaviour = std::variant<AwaitInProgress, RaceEmptyPayload, RacePayload<P, E>>;

//! \brief A payload construction strategy over pool and client types
//! \details Builders expose their Attributes, Payload and Error types and three entry points:
//!  - try_build: one build attempt, returning Cancelled once args.cancel fired and never returning a Better payload
//!    that does not improve on args.best_payload
//!  - on_missing_payload: behaviour when the payload is requested before any attempt completed
//!  - build_empty_payload: a payload without transactions, the fallback when no attempt completed in time
template <class B, class Pool, class Client>
concept PayloadBuilder =
    std::copy_constructible<B> && PayloadAttributes<typename B::Attributes> && BuiltPayload<typename B::Payload> &&
    requires(const B& builder, BuildArguments<Pool, Client, typename B::Attributes, typename B::Payload> args,
             const Client& client, const PayloadConfig<typename B::Attributes>& config) {
        { builder.try_build(args) } -> std::same_as<tl::expected<BuildOutcome<typename B::Payload>, typename B::Error>>;
        { builder.on_missing_payload(args) } -> std::same_as<MissingPayloadBehaviour<typename B::Payload, typename B::Error>>;
        { builder.build_empty_payload(client, config) } -> std::same_as<tl::expected<typename B::Payload, typename B::Error>>;
    };

}  // namespace blockforge::payload
