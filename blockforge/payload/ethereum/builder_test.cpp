// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "builder.hpp"

#include <limits>

#include <catch2/catch_test_macros.hpp>

#include <blockforge/chain/test_util/sample_chain.hpp>
#include <blockforge/infra/test_util/log.hpp>
#include <blockforge/payload/block_assembly.hpp>

namespace blockforge::payload::ethereum {

using namespace blockforge::chain::test_util;

static EthPayloadAttributes sample_attributes(const SampleChain& chain) {
    return *EthPayloadAttributes::try_new(chain.parent->hash(), RawPayloadAttributes{
                                                                    .version = EngineApiVersion::kV3,
                                                                    .timestamp = kSampleParentTimestamp + 12,
                                                                    .prev_randao = evmc::bytes32{7},
                                                                    .suggested_fee_recipient = kBob,
                                                                    .withdrawals = std::vector<Withdrawal>{},
                                                                    .parent_beacon_block_root = evmc::bytes32{8},
                                                                });
}

static EthereumPayloadBuilder::Arguments sample_arguments(const SampleChain& chain,
                                                          std::optional<EthBuiltPayload> best_payload = std::nullopt) {
    return {
        .client = chain.client,
        .pool = chain.pool,
        .cached_reads = {},
        .config = {.parent_header = chain.parent, .extra_data = Bytes{0xbf}, .attributes = sample_attributes(chain)},
        .cancel = CancellationToken{},
        .best_payload = std::move(best_payload),
    };
}

TEST_CASE("EthereumPayloadBuilder builds from the pool", "[blockforge][payload][ethereum]") {
    test_util::SetLogVerbosityGuard guard{log::Level::kNone};
    SampleChain chain;
    chain.client->set_account(kAlice, AccountInfo{.nonce = 4});
    const auto first{sample_transaction(kAlice, 4, 3)};
    const auto second{sample_transaction(kAlice, 5, 1)};
    const auto gapped{sample_transaction(kBob, 2, 10)};
    chain.add(first);
    chain.add(second);
    chain.add(gapped);

    EthereumPayloadBuilder builder;
    const auto result{builder.try_build(sample_arguments(chain))};
    REQUIRE(result);
    const auto* payload{better_payload(*result)};
    REQUIRE(payload);

    const auto& block{payload->block()};
    const auto& header{block.header.header()};
    CHECK(block.transactions == std::vector<Bytes>{first.envelope, second.envelope});
    CHECK(payload->fees() == intx::uint256{4 * kGiga} * 21'000);
    CHECK(payload->id() == sample_attributes(chain).payload_id());
    CHECK(header.parent_hash == chain.parent->hash());
    CHECK(header.number == 101);
    CHECK(header.timestamp == kSampleParentTimestamp + 12);
    CHECK(header.beneficiary == kBob);
    CHECK(header.gas_limit == kSampleGasLimit);
    CHECK(header.gas_used == 42'000);
    CHECK(header.base_fee_per_gas == kSampleBaseFee);
    CHECK(header.extra_data == Bytes{0xbf});
    CHECK(header.state_root == chain.parent->header().state_root);
    CHECK(header.transactions_root == transactions_commitment(block.transactions));
    CHECK(header.withdrawals_root == withdrawals_commitment({}));
    CHECK(header.parent_beacon_block_root == evmc::bytes32{8});

    // the sender nonces read during selection come back with the outcome
    CHECK(std::get<Better<EthBuiltPayload>>(*result).cached_reads.contains_account(kAlice));
}

TEST_CASE("EthereumPayloadBuilder honours the configured gas limit", "[blockforge][payload][ethereum]") {
    test_util::SetLogVerbosityGuard guard{log::Level::kNone};
    SampleChain chain;
    chain.add(sample_transaction(kAlice, 0, 5, 25'000));
    chain.add(sample_transaction(kBob, 0, 1, 21'000));

    EthereumPayloadBuilder builder{EthereumBuilderConfig{.gas_limit = 24'000}};
    const auto result{builder.try_build(sample_arguments(chain))};
    REQUIRE(result);
    REQUIRE(better_payload(*result));
    const auto& header{better_payload(*result)->block().header.header()};
    CHECK(header.gas_limit == 24'000);
    CHECK(header.gas_used == 21'000);
}

TEST_CASE("EthereumPayloadBuilder skips transactions whose gas would overflow", "[blockforge][payload][ethereum]") {
    test_util::SetLogVerbosityGuard guard{log::Level::kNone};
    SampleChain chain;
    const auto fitting{sample_transaction(kAlice, 0, 3)};
    // 21'000 + gas_limit wraps around to a value below the block gas limit
    const auto oversized{sample_transaction(kBob, 0, 1, std::numeric_limits<uint64_t>::max() - 10'000)};
    chain.add(fitting);
    chain.add(oversized);

    const auto result{EthereumPayloadBuilder{}.try_build(sample_arguments(chain))};
    REQUIRE(result);
    REQUIRE(better_payload(*result));
    const auto& block{better_payload(*result)->block()};
    CHECK(block.transactions == std::vector<Bytes>{fitting.envelope});
    CHECK(block.header.header().gas_used == 21'000);
}

TEST_CASE("EthereumPayloadBuilder never returns a payload not better than the best", "[blockforge][payload][ethereum]") {
    test_util::SetLogVerbosityGuard guard{log::Level::kNone};
    SampleChain chain;
    chain.add(sample_transaction(kAlice, 0, 1));

    EthereumPayloadBuilder builder;
    const auto first{builder.try_build(sample_arguments(chain))};
    REQUIRE(first);
    REQUIRE(better_payload(*first));
    const EthBuiltPayload best{*better_payload(*first)};

    const auto second{builder.try_build(sample_arguments(chain, best))};
    REQUIRE(second);
    REQUIRE(std::holds_alternative<Aborted>(*second));
    CHECK(std::get<Aborted>(*second).fees == best.fees());

    chain.add(sample_transaction(kBob, 0, 2));
    const auto third{builder.try_build(sample_arguments(chain, best))};
    REQUIRE(third);
    REQUIRE(better_payload(*third));
    CHECK(better_payload(*third)->fees() > best.fees());
}

TEST_CASE("EthereumPayloadBuilder observes cancellation", "[blockforge][payload][ethereum]") {
    SampleChain chain;
    chain.add(sample_transaction(kAlice, 0, 1));
    auto args{sample_arguments(chain)};
    args.cancel.signal_cancellation();

    const auto result{EthereumPayloadBuilder{}.try_build(std::move(args))};
    REQUIRE(result);
    CHECK(std::holds_alternative<Cancelled>(*result));
}

TEST_CASE("EthereumPayloadBuilder reports an unknown parent", "[blockforge][payload][ethereum]") {
    SampleChain chain;
    auto args{sample_arguments(chain)};
    args.config.parent_header = nullptr;
    args.config.attributes = *EthPayloadAttributes::try_new(Hash{evmc::bytes32{0xdead}}, args.config.attributes.raw());

    const auto result{EthereumPayloadBuilder{}.try_build(std::move(args))};
    REQUIRE_FALSE(result);
    CHECK(result.error().code() == PayloadBuilderError::Code::kMissingParentHeader);
}

TEST_CASE("EthereumPayloadBuilder empty payload and missing payload behaviour", "[blockforge][payload][ethereum]") {
    SampleChain chain;
    chain.add(sample_transaction(kAlice, 0, 1));
    EthereumPayloadBuilder builder;

    const auto args{sample_arguments(chain)};
    const auto empty{builder.build_empty_payload(*chain.client, args.config)};
    REQUIRE(empty);
    CHECK(empty->block().transactions.empty());
    CHECK(empty->fees() == 0);
    CHECK(empty->block().header.header().gas_used == 0);
    CHECK(empty->id() == args.config.attributes.payload_id());

    CHECK(std::holds_alternative<RaceEmptyPayload>(builder.on_missing_payload(args)));
}

TEST_CASE("expected_base_fee_per_gas", "[blockforge][payload][ethereum]") {
    BlockHeader parent{.gas_limit = 30'000'000, .gas_used = 15'000'000, .base_fee_per_gas = intx::uint256{kGiga}};
    CHECK(expected_base_fee_per_gas(parent) == kGiga);

    parent.gas_used = 30'000'000;
    CHECK(expected_base_fee_per_gas(parent) == kGiga + kGiga / 8);

    parent.gas_used = 0;
    CHECK(expected_base_fee_per_gas(parent) == kGiga - kGiga / 8);

    parent.base_fee_per_gas.reset();
    CHECK(expected_base_fee_per_gas(parent) == kInitialBaseFee);
}

}  // namespace blockforge::payload::ethereum
