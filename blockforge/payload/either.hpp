// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <utility>
#include <variant>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <tl/expected.hpp>

#include <blockforge/core/common/base.hpp>
#include <blockforge/core/types/block.hpp>
#include <blockforge/core/types/hash.hpp>
#include <blockforge/core/types/withdrawal.hpp>
#include <blockforge/infra/common/ensure.hpp>

namespace blockforge::payload {

enum class Side {
    kLeft,
    kRight,
};

template <class L, class R>
class Either;

//! \brief Raw input types and rejection error of an attributes type, looked up through traits so that Either can
//! derive its own from the alternatives
template <class A>
struct AttributesTraits {
    using RawAttributes = typename A::RawAttributes;
    using Error = typename A::Error;
};

template <class L, class R>
struct AttributesTraits<Either<L, R>> {
    using RawAttributes = Either<typename AttributesTraits<L>::RawAttributes, typename AttributesTraits<R>::RawAttributes>;
    using Error = Either<typename AttributesTraits<L>::Error, typename AttributesTraits<R>::Error>;
};

template <class A>
using RawAttributesOf = typename AttributesTraits<A>::RawAttributes;

template <class A>
using AttributesErrorOf = typename AttributesTraits<A>::Error;

template <class L, class R>
tl::expected<Either<L, R>, AttributesErrorOf<Either<L, R>>> try_new_attributes(
    const Hash& parent, const RawAttributesOf<Either<L, R>>& raw);

//! \brief Tagged union of exactly two alternatives, Left(L) or Right(R)
//! \details Also forwards the attributes and built payload accessors to the active alternative when both sides
//! provide them, so that two unrelated type families can be addressed through one combined type.
//! \remarks L and R may be the same type: the tag, not the type, tells the alternatives apart
template <class L, class R>
class Either {
  public:
    using LeftType = L;
    using RightType = R;

    static Either left(L value) { return Either{std::in_place_index<0>, std::move(value)}; }
    static Either right(R value) { return Either{std::in_place_index<1>, std::move(value)}; }

    template <Side S, class T>
    static Either from(T&& value) {
        if constexpr (S == Side::kLeft) {
            return left(std::forward<T>(value));
        } else {
            return right(std::forward<T>(value));
        }
    }

    Side side() const { return value_.index() == 0 ? Side::kLeft : Side::kRight; }
    bool is_left() const { return value_.index() == 0; }
    bool is_right() const { return value_.index() == 1; }

    const L& get_left() const& {
        ensure(is_left(), "Either: left alternative requested on a right value");
        return std::get<0>(value_);
    }
    L&& get_left() && {
        ensure(is_left(), "Either: left alternative requested on a right value");
        return std::get<0>(std::move(value_));
    }
    const R& get_right() const& {
        ensure(is_right(), "Either: right alternative requested on a left value");
        return std::get<1>(value_);
    }
    R&& get_right() && {
        ensure(is_right(), "Either: right alternative requested on a left value");
        return std::get<1>(std::move(value_));
    }

    template <Side S>
    const auto& get() const& {
        if constexpr (S == Side::kLeft) {
            return get_left();
        } else {
            return get_right();
        }
    }

    //! Invoke on_left or on_right on the active alternative, both must return the same type
    template <class OnLeft, class OnRight>
    decltype(auto) match(OnLeft&& on_left, OnRight&& on_right) const& {
        if (is_left()) return std::forward<OnLeft>(on_left)(std::get<0>(value_));
        return std::forward<OnRight>(on_right)(std::get<1>(value_));
    }
    template <class OnLeft, class OnRight>
    decltype(auto) match(OnLeft&& on_left, OnRight&& on_right) && {
        if (is_left()) return std::forward<OnLeft>(on_left)(std::get<0>(std::move(value_)));
        return std::forward<OnRight>(on_right)(std::get<1>(std::move(value_)));
    }

    // Attributes accessors

    //! \see try_new_attributes
    template <class LL = L, class RR = R>
    static tl::expected<Either, AttributesErrorOf<Either<LL, RR>>> try_new(const Hash& parent,
                                                                          const RawAttributesOf<Either<LL, RR>>& raw) {
        return try_new_attributes<LL, RR>(parent, raw);
    }

    PayloadId payload_id() const
        requires requires(const L& l, const R& r) { l.payload_id(); r.payload_id(); }
    {
        return match([](const L& l) { return l.payload_id(); }, [](const R& r) { return r.payload_id(); });
    }

    Hash parent() const
        requires requires(const L& l, const R& r) { l.parent(); r.parent(); }
    {
        return match([](const L& l) { return Hash{l.parent()}; }, [](const R& r) { return Hash{r.parent()}; });
    }

    BlockTime timestamp() const
        requires requires(const L& l, const R& r) { l.timestamp(); r.timestamp(); }
    {
        return match([](const L& l) { return l.timestamp(); }, [](const R& r) { return r.timestamp(); });
    }

    std::optional<evmc::bytes32> parent_beacon_block_root() const
        requires requires(const L& l, const R& r) { l.parent_beacon_block_root(); r.parent_beacon_block_root(); }
    {
        return match([](const L& l) { return l.parent_beacon_block_root(); },
                     [](const R& r) { return r.parent_beacon_block_root(); });
    }

    evmc::address suggested_fee_recipient() const
        requires requires(const L& l, const R& r) { l.suggested_fee_recipient(); r.suggested_fee_recipient(); }
    {
        return match([](const L& l) { return l.suggested_fee_recipient(); },
                     [](const R& r) { return r.suggested_fee_recipient(); });
    }

    evmc::bytes32 prev_randao() const
        requires requires(const L& l, const R& r) { l.prev_randao(); r.prev_randao(); }
    {
        return match([](const L& l) { return l.prev_randao(); }, [](const R& r) { return r.prev_randao(); });
    }

    const std::optional<std::vector<Withdrawal>>& withdrawals() const
        requires requires(const L& l, const R& r) { l.withdrawals(); r.withdrawals(); }
    {
        return match([](const L& l) -> const std::optional<std::vector<Withdrawal>>& { return l.withdrawals(); },
                     [](const R& r) -> const std::optional<std::vector<Withdrawal>>& { return r.withdrawals(); });
    }

    // Built payload accessors

    const SealedBlock& block() const
        requires requires(const L& l, const R& r) { l.block(); r.block(); }
    {
        return match([](const L& l) -> const SealedBlock& { return l.block(); },
                     [](const R& r) -> const SealedBlock& { return r.block(); });
    }

    intx::uint256 fees() const
        requires requires(const L& l, const R& r) { l.fees(); r.fees(); }
    {
        return match([](const L& l) { return intx::uint256{l.fees()}; }, [](const R& r) { return intx::uint256{r.fees()}; });
    }

    friend bool operator==(const Either&, const Either&) = default;

  private:
    template <size_t I, class T>
    Either(std::in_place_index_t<I> index, T&& value) : value_{index, std::forward<T>(value)} {}

    std::variant<L, R> value_;
};

template <class L, class R>
std::ostream& operator<<(std::ostream& out, const Either<L, R>& either) {
    either.match([&](const L& l) { out << "Left(" << l << ")"; }, [&](const R& r) { out << "Right(" << r << ")"; });
    return out;
}

//! \brief Builds Either attributes from Either raw attributes: the raw tag picks the alternative that validates them
//! \return attributes tagged like the raw input, or the alternative's rejection tagged the same way
template <class L, class R>
tl::expected<Either<L, R>, AttributesErrorOf<Either<L, R>>> try_new_attributes(
    const Hash& parent, const RawAttributesOf<Either<L, R>>& raw) {
    using Result = tl::expected<Either<L, R>, AttributesErrorOf<Either<L, R>>>;
    using Error = AttributesErrorOf<Either<L, R>>;
    return raw.match(
        [&](const RawAttributesOf<L>& raw_left) -> Result {
            auto attributes{L::try_new(parent, raw_left)};
            if (!attributes) return tl::unexpected{Error::left(std::move(attributes.error()))};
            return Either<L, R>::left(std::move(*attributes));
        },
        [&](const RawAttributesOf<R>& raw_right) -> Result {
            auto attributes{R::try_new(parent, raw_right)};
            if (!attributes) return tl::unexpected{Error::right(std::move(attributes.error()))};
            return Either<L, R>::right(std::move(*attributes));
        });
}

}  // namespace blockforge::payload
