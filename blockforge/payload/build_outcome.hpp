// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <type_traits>
#include <utility>
#include <variant>

#include <intx/intx.hpp>

#include <blockforge/core/common/overloaded.hpp>
#include <blockforge/payload/cached_reads.hpp>
#include <blockforge/payload/either.hpp>

namespace blockforge::payload {

//! A payload better than the best one known was built
template <class P>
struct Better {
    P payload;
    CachedReads cached_reads;

    friend bool operator==(const Better&, const Better&) = default;
};

//! No better payload was built, fees is the total of the best payload known
struct Aborted {
    intx::uint256 fees;
    CachedReads cached_reads;

    friend bool operator==(const Aborted&, const Aborted&) = default;
};

//! The attempt observed cancellation
struct Cancelled {
    friend bool operator==(const Cancelled&, const Cancelled&) = default;
};

//! Result of one build attempt
template <class P>
using BuildOutcome = std::variant<Better<P>, Aborted, Cancelled>;

//! \brief Re-type the payload of an outcome, keeping its cached reads untouched
//! \details Better{p, c} maps to Better{f(p), c}, Aborted passes through, Cancelled maps to Cancelled without calling f
template <class P, class F>
BuildOutcome<std::invoke_result_t<F, P&&>> map_payload(BuildOutcome<P> outcome, F&& f) {
    using Mapped = std::invoke_result_t<F, P&&>;
    return std::visit(
        Overloaded{
            [&](Better<P>&& better) -> BuildOutcome<Mapped> {
                return Better<Mapped>{std::forward<F>(f)(std::move(better.payload)), std::move(better.cached_reads)};
            },
            [](Aborted&& aborted) -> BuildOutcome<Mapped> { return std::move(aborted); },
            [](Cancelled&&) -> BuildOutcome<Mapped> { return Cancelled{}; },
        },
        std::move(outcome));
}

//! The payload carried by a Better outcome, nullptr otherwise
template <class P>
const P* better_payload(const BuildOutcome<P>& outcome) {
    const auto* better{std::get_if<Better<P>>(&outcome)};
    return better ? &better->payload : nullptr;
}

}  // namespace blockforge::payload
