// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <optional>
#include <utility>
#include <variant>

#include <tl/expected.hpp>

#include <blockforge/core/common/overloaded.hpp>
#include <blockforge/infra/common/log.hpp>
#include <blockforge/payload/build_outcome.hpp>
#include <blockforge/payload/either.hpp>
#include <blockforge/payload/errors.hpp>
#include <blockforge/payload/payload_builder.hpp>

namespace blockforge::payload {

//! How a PayloadBuilderStack combines its two builders
enum class FallbackPolicy {
    //! Both sides share one type family: left runs first, right runs only when left fails
    kTryBoth,
    //! Attributes are Either-tagged: the tag alone picks the side, the other side never runs
    kExclusiveByTag,
};

template <class L, class R>
concept SameBuilderTypes = std::same_as<typename L::Attributes, typename R::Attributes> &&
                           std::same_as<typename L::Payload, typename R::Payload> &&
                           std::same_as<typename L::Error, typename R::Error>;

//! \brief Builder combinator owning two builders and dispatching each entry point according to Policy
//! \remarks stacks nest (PayloadBuilderStack<PayloadBuilderStack<A, B, P>, C, Q>) and are copyable when both
//! sides are
template <class L, class R, FallbackPolicy Policy>
class PayloadBuilderStack;

template <class L, class R>
    requires SameBuilderTypes<L, R>
class PayloadBuilderStack<L, R, FallbackPolicy::kTryBoth> {
  public:
    using Attributes = typename L::Attributes;
    using Payload = typename L::Payload;
    using Error = typename L::Error;

    PayloadBuilderStack(L left, R right) : left_{std::move(left)}, right_{std::move(right)} {}

    const L& left() const { return left_; }
    const R& right() const { return right_; }

    //! \brief Left outcome as is whenever left succeeds (Aborted and Cancelled included), otherwise right's result
    //! \remarks right works on the arguments left was given, not on anything left produced
    template <class Pool, class Client>
    tl::expected<BuildOutcome<Payload>, Error> try_build(BuildArguments<Pool, Client, Attributes, Payload> args) const {
        auto left_result{left_.try_build(args)};
        if (left_result) {
            return left_result;
        }
        FORGE_DEBUG_M("PayloadBuilderStack") << "left builder failed, trying right: " << error_message(left_result.error());
        return right_.try_build(std::move(args));
    }

    //! Left behaviour unless left asks to race an empty payload, in which case right decides
    template <class Pool, class Client>
    MissingPayloadBehaviour<Payload, Error> on_missing_payload(
        BuildArguments<Pool, Client, Attributes, Payload> args) const {
        auto behaviour{left_.on_missing_payload(args)};
        if (!std::holds_alternative<RaceEmptyPayload>(behaviour)) {
            return behaviour;
        }
        return right_.on_missing_payload(std::move(args));
    }

    //! \brief Left empty payload, else right's; when both fail the failures are composed if Error supports it,
    //! otherwise right's error is returned
    template <class Client>
    tl::expected<Payload, Error> build_empty_payload(const Client& client,
                                                     const PayloadConfig<Attributes>& config) const {
        auto left_result{left_.build_empty_payload(client, config)};
        if (left_result) {
            return left_result;
        }
        FORGE_DEBUG_M("PayloadBuilderStack") << "left empty payload failed, trying right: "
                                             << error_message(left_result.error());
        auto right_result{right_.build_empty_payload(client, config)};
        if (right_result) {
            return right_result;
        }
        FORGE_WARN_M("PayloadBuilderStack") << "empty payload failed on both builders";
        if constexpr (ComposableError<Error>) {
            return tl::unexpected{Error::both_failed(std::move(left_result.error()), std::move(right_result.error()))};
        } else {
            return right_result;
        }
    }

  private:
    L left_;
    R right_;
};

template <class L, class R>
class PayloadBuilderStack<L, R, FallbackPolicy::kExclusiveByTag> {
  public:
    using Attributes = Either<typename L::Attributes, typename R::Attributes>;
    using Payload = Either<typename L::Payload, typename R::Payload>;
    using Error = Either<typename L::Error, typename R::Error>;

    PayloadBuilderStack(L left, R right) : left_{std::move(left)}, right_{std::move(right)} {}

    const L& left() const { return left_; }
    const R& right() const { return right_; }

    //! Build on the side the attributes are tagged with, re-tagging its outcome or its error
    template <class Pool, class Client>
    tl::expected<BuildOutcome<Payload>, Error> try_build(BuildArguments<Pool, Client, Attributes, Payload> args) const {
        if (args.config.attributes.is_left()) {
            return try_build_on<Side::kLeft>(left_, std::move(args));
        }
        return try_build_on<Side::kRight>(right_, std::move(args));
    }

    template <class Pool, class Client>
    MissingPayloadBehaviour<Payload, Error> on_missing_payload(
        BuildArguments<Pool, Client, Attributes, Payload> args) const {
        if (args.config.attributes.is_left()) {
            return on_missing_payload_on<Side::kLeft>(left_, std::move(args));
        }
        return on_missing_payload_on<Side::kRight>(right_, std::move(args));
    }

    //! \brief Empty payload of the tagged side
    //! \remarks a failure is returned tagged with its side, there is no fallback to the other side
    template <class Client>
    tl::expected<Payload, Error> build_empty_payload(const Client& client,
                                                     const PayloadConfig<Attributes>& config) const {
        if (config.attributes.is_left()) {
            return build_empty_payload_on<Side::kLeft>(left_, client, config);
        }
        return build_empty_payload_on<Side::kRight>(right_, client, config);
    }

  private:
    template <Side S, class B>
    static PayloadConfig<typename B::Attributes> narrow_config(const PayloadConfig<Attributes>& config) {
        return {
            .parent_header = config.parent_header,
            .extra_data = config.extra_data,
            .attributes = config.attributes.template get<S>(),
        };
    }

    //! Side-typed arguments sharing client, pool and cancellation, with a best payload only if tagged for S
    template <Side S, class B, class Pool, class Client>
    static BuildArguments<Pool, Client, typename B::Attributes, typename B::Payload> narrow(
        BuildArguments<Pool, Client, Attributes, Payload>&& args) {
        std::optional<typename B::Payload> best_payload;
        if (args.best_payload && args.best_payload->side() == S) {
            best_payload = args.best_payload->template get<S>();
        }
        return {
            .client = std::move(args.client),
            .pool = std::move(args.pool),
            .cached_reads = std::move(args.cached_reads),
            .config = narrow_config<S, B>(args.config),
            .cancel = std::move(args.cancel),
            .best_payload = std::move(best_payload),
        };
    }

    template <Side S, class B, class Pool, class Client>
    static tl::expected<BuildOutcome<Payload>, Error> try_build_on(
        const B& builder, BuildArguments<Pool, Client, Attributes, Payload>&& args) {
        auto result{builder.try_build(narrow<S, B>(std::move(args)))};
        if (!result) {
            return tl::unexpected{Error::template from<S>(std::move(result.error()))};
        }
        return map_payload(std::move(*result),
                           [](typename B::Payload&& payload) { return Payload::template from<S>(std::move(payload)); });
    }

    template <Side S, class B, class Pool, class Client>
    static MissingPayloadBehaviour<Payload, Error> on_missing_payload_on(
        const B& builder, BuildArguments<Pool, Client, Attributes, Payload>&& args) {
        using SidePayload = typename B::Payload;
        using SideError = typename B::Error;
        return std::visit(
            Overloaded{
                [](AwaitInProgress) -> MissingPayloadBehaviour<Payload, Error> { return AwaitInProgress{}; },
                [](RaceEmptyPayload) -> MissingPayloadBehaviour<Payload, Error> { return RaceEmptyPayload{}; },
                [](RacePayload<SidePayload, SideError>&& race) -> MissingPayloadBehaviour<Payload, Error> {
                    return RacePayload<Payload, Error>{
                        [job = std::move(race.job)]() -> tl::expected<Payload, Error> {
                            auto payload{job()};
                            if (!payload) {
                                return tl::unexpected{Error::template from<S>(std::move(payload.error()))};
                            }
                            return Payload::template from<S>(std::move(*payload));
                        }};
                },
            },
            builder.on_missing_payload(narrow<S, B>(std::move(args))));
    }

    template <Side S, class B, class Client>
    static tl::expected<Payload, Error> build_empty_payload_on(const B& builder, const Client& client,
                                                               const PayloadConfig<Attributes>& config) {
        auto payload{builder.build_empty_payload(client, narrow_config<S, B>(config))};
        if (!payload) {
            if constexpr (S == Side::kLeft) {
                FORGE_WARN_M("PayloadBuilderStack") << "left empty payload failed: " << error_message(payload.error());
            }
            return tl::unexpected{Error::template from<S>(std::move(payload.error()))};
        }
        return Payload::template from<S>(std::move(*payload));
    }

    L left_;
    R right_;
};

}  // namespace blockforge::payload
