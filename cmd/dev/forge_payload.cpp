// Copyright 2025 The Blockforge Authors
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <CLI/CLI.hpp>

#include <blockforge/chain/in_memory_client.hpp>
#include <blockforge/chain/in_memory_pool.hpp>
#include <blockforge/core/common/util.hpp>
#include <blockforge/core/rlp/encode.hpp>
#include <blockforge/infra/cli/common.hpp>
#include <blockforge/infra/common/log.hpp>
#include <blockforge/infra/concurrency/context.hpp>
#include <blockforge/payload/builder_stack.hpp>
#include <blockforge/payload/ethereum/builder.hpp>
#include <blockforge/payload/job/payload_job_generator.hpp>
#include <blockforge/payload/optimism/builder.hpp>

using namespace blockforge;
using namespace std::chrono_literals;

using ForgeBuilder = payload::PayloadBuilderStack<payload::ethereum::EthereumPayloadBuilder,
                                                  payload::optimism::OptimismPayloadBuilder,
                                                  payload::FallbackPolicy::kExclusiveByTag>;
using ForgeGenerator = payload::job::PayloadJobGenerator<ForgeBuilder>;
using ForgeRawAttributes = payload::RawAttributesOf<ForgeBuilder::Attributes>;

struct app_options_t {
    bool rollup{false};            // Build through the rollup builder instead of the Ethereum one
    bool no_tx_pool{false};        // Rollup only: build from sequencer transactions alone
    uint32_t pool_txs{32};         // Synthetic transactions put in the pool
    uint32_t sequencer_txs{1};     // Rollup only: deposits forced by the sequencer
    uint32_t resolve_after_ms{50};  // Delay before resolving the payload
};

static constexpr uint64_t kDevChainId{1337};
static constexpr uint64_t kDevGasLimit{30'000'000};

static evmc::address dev_account(uint32_t index) {
    evmc::address address;
    address.bytes[0] = 0xde;
    address.bytes[19] = static_cast<uint8_t>(index);
    address.bytes[18] = static_cast<uint8_t>(index >> 8);
    return address;
}

static Bytes encoded(const Transaction& txn) {
    Bytes envelope;
    rlp::encode(envelope, txn);
    return envelope;
}

//! Fill the pool with transfers from a handful of senders, each with increasing nonces and tips
static void populate_pool(chain::InMemoryTransactionPool& pool, const intx::uint256& base_fee, uint32_t count) {
    constexpr uint32_t kSenders{4};
    for (uint32_t i{0}; i < count; ++i) {
        const Transaction txn{
            .type = TransactionType::kDynamicFee,
            .chain_id = kDevChainId,
            .nonce = i / kSenders,
            .max_priority_fee_per_gas = intx::uint256{1 + i % 5} * kGiga,
            .max_fee_per_gas = base_fee + intx::uint256{5} * kGiga,
            .gas_limit = 21'000,
            .to = dev_account(1000 + i),
            .value = kGiga,
        };
        auto recovered{RecoveredTransaction::from_envelope(encoded(txn), dev_account(i % kSenders))};
        if (!recovered) {
            throw std::runtime_error{"cannot decode synthetic transaction " + std::to_string(i)};
        }
        pool.add_transaction({.transaction = std::move(*recovered), .origin = TransactionOrigin::kLocal});
    }
}

static std::vector<Bytes> sequencer_deposits(uint32_t count) {
    std::vector<Bytes> deposits;
    for (uint32_t i{0}; i < count; ++i) {
        deposits.push_back(encoded(Transaction{
            .type = TransactionType::kDeposit,
            .gas_limit = 100'000,
            .to = dev_account(2000 + i),
            .source_hash = evmc::bytes32{i + 1},
            .from = dev_account(3000),
        }));
    }
    return deposits;
}

static ForgeRawAttributes raw_attributes(const app_options_t& options, const SealedHeader& parent) {
    payload::ethereum::RawPayloadAttributes attributes{
        .version = payload::ethereum::EngineApiVersion::kV3,
        .timestamp = parent.header().timestamp + 12,
        .prev_randao = evmc::bytes32{parent.number()},
        .suggested_fee_recipient = dev_account(0xfee),
        .withdrawals = std::vector<Withdrawal>{},
        .parent_beacon_block_root = evmc::bytes32{1},
    };
    if (!options.rollup) {
        return ForgeRawAttributes::left(std::move(attributes));
    }
    return ForgeRawAttributes::right(payload::optimism::RawOpPayloadAttributes{
        .payload_attributes = std::move(attributes),
        .transactions = sequencer_deposits(options.sequencer_txs),
        .no_tx_pool = options.no_tx_pool,
        .gas_limit = kDevGasLimit,
    });
}

static void print_payload(const ForgeBuilder::Payload& payload) {
    const auto& block{payload.block()};
    const auto& header{block.header.header()};
    std::cout << "block:        " << block.number() << " " << block.hash().to_hex() << "\n"
              << "builder:      " << (payload.is_left() ? "ethereum" : "optimism") << "\n"
              << "parent:       " << to_hex(header.parent_hash, true) << "\n"
              << "transactions: " << block.transactions.size() << "\n"
              << "gas used:     " << header.gas_used << " / " << header.gas_limit << "\n"
              << "fees:         " << intx::to_string(payload.fees()) << "\n";
}

int main(int argc, char* argv[]) {
    CLI::App app{"Build one payload on a synthetic in-memory chain"};

    app_options_t options;
    log::Settings log_settings;
    log_settings.log_verbosity = log::Level::kInfo;
    payload::job::PayloadJobSettings job_settings{.interval = 10ms, .deadline = 1s};
    std::string extra_data_hex;

    cmd::common::add_logging_options(app, log_settings);
    cmd::common::add_payload_job_options(app, job_settings, extra_data_hex);
    app.add_flag("--rollup", options.rollup, "Build a rollup payload with sequencer transactions");
    app.add_flag("--no-tx-pool", options.no_tx_pool, "Exclude pool transactions from rollup payloads")->needs("--rollup");
    app.add_option("--pool-txs", options.pool_txs, "Number of synthetic pool transactions")
        ->capture_default_str()
        ->check(CLI::Range(0u, 10'000u));
    app.add_option("--sequencer-txs", options.sequencer_txs, "Number of sequencer deposits in rollup payloads")
        ->capture_default_str()
        ->check(CLI::Range(0u, 100u));
    app.add_option("--resolve-after", options.resolve_after_ms, "Milliseconds to build before resolving the payload")
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv)

    int rc{0};
    try {
        cmd::common::apply_payload_job_options(job_settings, extra_data_hex);
        log::init(log_settings);
        log::set_thread_name("main");

        auto client{std::make_shared<chain::InMemoryChainClient>(kDevChainId)};
        auto pool{std::make_shared<chain::InMemoryTransactionPool>()};
        const auto parent{client->insert_header(BlockHeader{
            .number = 1'000,
            .gas_limit = kDevGasLimit,
            .gas_used = kDevGasLimit / 2,
            .timestamp = static_cast<BlockTime>(std::chrono::duration_cast<std::chrono::seconds>(
                                                    std::chrono::system_clock::now().time_since_epoch())
                                                    .count()),
            .base_fee_per_gas = intx::uint256{kGiga},
        })};
        populate_pool(*pool, payload::expected_base_fee_per_gas(parent->header()), options.pool_txs);
        log::Info("Synthetic chain ready", {"parent", parent->hash().to_hex(), "pool", std::to_string(pool->size())});

        // Declared before the generator: jobs are stopped before the execution thread is joined
        concurrency::Context context;
        context.start("builder");

        ForgeBuilder builder{payload::ethereum::EthereumPayloadBuilder{{.gas_limit = job_settings.gas_limit}},
                             payload::optimism::OptimismPayloadBuilder{}};
        ForgeGenerator generator{context.executor(), builder, client, pool, job_settings};

        const auto id{generator.new_payload_job(parent->hash(), raw_attributes(options, *parent))};
        if (id) {
            std::this_thread::sleep_for(std::chrono::milliseconds{options.resolve_after_ms});
            const auto payload{generator.resolve(*id)};
            if (payload) {
                std::cout << "payload id:   " << payload::payload_id_to_hex(*id) << "\n";
                print_payload(*payload);
            } else {
                log::Error("Cannot resolve payload", {"id", payload::payload_id_to_hex(*id),
                                                      "error", payload::error_message(payload.error())});
                rc = 1;
            }
        } else {
            log::Error("Cannot start payload job", {"error", payload::error_message(id.error())});
            rc = 1;
        }
    } catch (const std::exception& ex) {
        log::Error() << ex.what();
        rc = -1;
    }

    return rc;
}
