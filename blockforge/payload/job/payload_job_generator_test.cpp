// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include "payload_job_generator.hpp"

#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>

#include <blockforge/chain/test_util/sample_chain.hpp>
#include <blockforge/infra/test_util/log.hpp>
#include <blockforge/payload/test_util/test_builders.hpp>

namespace blockforge::payload::job {

using namespace std::chrono_literals;
using namespace blockforge::payload::test_util;
using chain::test_util::kSampleParentTimestamp;
using chain::test_util::SampleChain;

using Builder = ScriptedBuilder<1>;
using Generator = PayloadJobGenerator<Builder>;

static Builder generated_builder() {
    return Builder{"generated",
                   {.try_build = always_outcome<1>(Better<TestPayload<1>>{TestPayload<1>{1, "built"}, {}}),
                    .on_missing_payload = [] { return MissingPayloadBehaviour<TestPayload<1>, PayloadBuilderError>{AwaitInProgress{}}; }}};
}

static RawTestAttributes<1> raw_attributes(BlockTime delta, std::optional<std::string> reject_reason = std::nullopt) {
    return {.timestamp = kSampleParentTimestamp + delta, .reject_reason = std::move(reject_reason)};
}

class PayloadJobGeneratorTest {
  protected:
    Generator make_generator(size_t max_payload_jobs = 4) {
        return Generator{ioc.get_executor(), generated_builder(), chain.client, chain.pool,
                         PayloadJobSettings{.interval = 1s, .deadline = 10s, .max_payload_jobs = max_payload_jobs,
                                            .extra_data = Bytes{0x0b, 0xf0}}};
    }

    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    boost::asio::io_context ioc;
    SampleChain chain;
};

TEST_CASE_METHOD(PayloadJobGeneratorTest, "PayloadJobGenerator starts one job per payload id",
                 "[blockforge][payload][job]") {
    auto generator{make_generator()};
    const auto id{generator.new_payload_job(chain.parent->hash(), raw_attributes(12))};
    REQUIRE(id);
    CHECK(*id == TestAttributes<1>::try_new(chain.parent->hash(), raw_attributes(12))->payload_id());

    const auto again{generator.new_payload_job(chain.parent->hash(), raw_attributes(12))};
    REQUIRE(again);
    CHECK(*again == *id);
    CHECK(generator.size() == 1);

    const auto job{generator.job(*id)};
    REQUIRE(job);
    CHECK(job->is_running());
    CHECK(job->config().parent_header == chain.parent);
    CHECK(job->config().extra_data == Bytes{0x0b, 0xf0});

    generator.stop_all();
    ioc.run();
}

TEST_CASE_METHOD(PayloadJobGeneratorTest, "PayloadJobGenerator rejections", "[blockforge][payload][job]") {
    auto generator{make_generator()};

    SECTION("invalid attributes are a left error") {
        const auto id{generator.new_payload_job(chain.parent->hash(), raw_attributes(12, "bad"))};
        REQUIRE_FALSE(id);
        REQUIRE(id.error().is_left());
        CHECK(id.error().get_left().message() == "bad");
    }

    SECTION("unknown parent is a right error") {
        const auto id{generator.new_payload_job(Hash{evmc::bytes32{0xdead}}, raw_attributes(12))};
        REQUIRE_FALSE(id);
        REQUIRE(id.error().is_right());
        CHECK(id.error().get_right().code() == PayloadBuilderError::Code::kMissingParentHeader);
    }

    SECTION("timestamp not after the parent's is a right error") {
        const auto id{generator.new_payload_job(chain.parent->hash(), raw_attributes(0))};
        REQUIRE_FALSE(id);
        REQUIRE(id.error().is_right());
        CHECK(id.error().get_right().code() == PayloadBuilderError::Code::kInternal);
    }

    CHECK(generator.size() == 0);
}

TEST_CASE_METHOD(PayloadJobGeneratorTest, "PayloadJobGenerator drops the oldest job", "[blockforge][payload][job]") {
    auto generator{make_generator(2)};
    const auto first{generator.new_payload_job(chain.parent->hash(), raw_attributes(1))};
    const auto second{generator.new_payload_job(chain.parent->hash(), raw_attributes(2))};
    REQUIRE(first);
    REQUIRE(second);
    const auto first_job{generator.job(*first)};

    const auto third{generator.new_payload_job(chain.parent->hash(), raw_attributes(3))};
    REQUIRE(third);
    CHECK(generator.size() == 2);
    CHECK_FALSE(generator.job(*first));
    CHECK(generator.job(*second));
    CHECK(generator.job(*third));
    REQUIRE(first_job);
    CHECK_FALSE(first_job->is_running());

    generator.stop_all();
    ioc.run();
}

TEST_CASE_METHOD(PayloadJobGeneratorTest, "PayloadJobGenerator resolve", "[blockforge][payload][job]") {
    auto generator{make_generator()};

    SECTION("unknown id") {
        const auto payload{generator.resolve(42)};
        REQUIRE_FALSE(payload);
        REQUIRE(payload.error().is_left());
        CHECK(payload.error().get_left().code() == PayloadBuilderError::Code::kMissingPayload);
    }

    SECTION("known id resolves and forgets the job") {
        const auto id{generator.new_payload_job(chain.parent->hash(), raw_attributes(12))};
        REQUIRE(id);
        ioc.run_one();  // first attempt
        const auto payload{generator.resolve(*id)};
        REQUIRE(payload);
        CHECK(payload->label() == "built");
        CHECK(generator.size() == 0);
        CHECK_FALSE(generator.resolve(*id));
        ioc.run();
    }
}

}  // namespace blockforge::payload::job
