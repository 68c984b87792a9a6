/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>

#include "accounts/impl/account_registry_impl.hpp"
#include "apps/impl/app_registry_impl.hpp"
#include "clock/impl/counter_clock.hpp"
#include "clock/impl/epoch_clock.hpp"
#include "clock/impl/system_wall_clock.hpp"
#include "common/endian.hpp"
#include "common/logger.hpp"
#include "crypto/blake2/blake2b.hpp"
#include "crypto/secp256k1/secp256k1_provider_impl.hpp"
#include "exchange/impl/exchange_impl.hpp"
#include "exchange/impl/in_memory_offer_store.hpp"
#include "node/config.hpp"
#include "primitives/address.hpp"
#include "token/token_escrow.hpp"

namespace datex {
  using crypto::secp256k1::PrivateKey;
  using crypto::secp256k1::Secp256k1ProviderImpl;
  using exchange::DataId;
  using exchange::Escrow;
  using node::Config;
  using node::Scenario;
  using primitives::Address;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("node");
      return logger.get();
    }

    /// Deterministic key of a scenario participant
    PrivateKey scenarioKey(uint8_t seed) {
      PrivateKey key;
      key.back() = seed;
      return key;
    }

    std::vector<DataId> scenarioDataIds(size_t count) {
      std::vector<DataId> data_ids;
      for (size_t i = 0; i < count; ++i) {
        Bytes seed;
        common::putUint64BigEndian(seed, i);
        data_ids.push_back(crypto::blake2b::blake2b_160(seed));
      }
      return data_ids;
    }

    std::vector<boost::signals2::scoped_connection> logEvents(
        exchange::events::Events &events) {
      std::vector<boost::signals2::scoped_connection> connections;
      connections.emplace_back(
          events.subscribeOfferPrepared([](const auto &event) {
            log()->info("OfferPrepared {} by {} at {}",
                        event.offer_id.toHex(),
                        event.by.toHex(),
                        event.at);
          }));
      connections.emplace_back(
          events.subscribeOfferPresented([](const auto &event) {
            log()->info("OfferPresented {} at {}",
                        event.offer_id.toHex(),
                        event.at);
          }));
      connections.emplace_back(
          events.subscribeOfferCanceled([](const auto &event) {
            log()->info("OfferCanceled {} at {}",
                        event.offer_id.toHex(),
                        event.at);
          }));
      connections.emplace_back(
          events.subscribeOfferSettled([](const auto &event) {
            log()->info("OfferSettled {} by {} at {}",
                        event.offer_id.toHex(),
                        event.by.toHex(),
                        event.at);
          }));
      connections.emplace_back(
          events.subscribeOfferReceipt([](const auto &event) {
            log()->info("OfferReceipt {} receipt {}",
                        event.offer_id.toHex(),
                        common::hex_lower(event.receipt));
          }));
      connections.emplace_back(
          events.subscribeEscrowExecutionFailed([](const auto &event) {
            log()->warn("EscrowExecutionFailed {} at {}: {}",
                        event.offer_id.toHex(),
                        event.at,
                        event.reason);
          }));
      connections.emplace_back(
          events.subscribeOfferRejected([](const auto &event) {
            log()->info("OfferRejected {} at {}",
                        event.offer_id.toHex(),
                        event.at);
          }));
      return connections;
    }

    std::shared_ptr<clock::LogicalClock> makeClock(
        const Config &config, std::shared_ptr<clock::CounterClock> counter) {
      if (config.clock_mode == node::ClockMode::kWall) {
        return std::make_shared<clock::EpochClock>(
            std::make_shared<clock::SystemWallClock>(),
            clock::ChainEpochClock{clock::UnixTime{config.genesis_time},
                                   clock::UnixTime{config.block_delay}});
      }
      return counter;
    }
  }  // namespace

  outcome::result<void> main(const Config &config) {
    auto counter{std::make_shared<clock::CounterClock>()};
    auto clock{makeClock(config, counter)};
    auto secp256k1{std::make_shared<Secp256k1ProviderImpl>()};

    OUTCOME_TRY(provider_key, secp256k1->derive(scenarioKey(1)));
    OUTCOME_TRY(consumer_key, secp256k1->derive(scenarioKey(2)));
    const auto provider{primitives::makeAddress(provider_key)};
    const auto consumer{primitives::makeAddress(consumer_key)};
    const auto token_address{crypto::blake2b::blake2b_160(asBytes("token"))};
    const auto escrow_address{crypto::blake2b::blake2b_160(asBytes("escrow"))};

    accounts::AccountRegistryImpl accounts{clock, secp256k1};
    OUTCOME_TRY(provider_account, accounts.create(provider));
    OUTCOME_TRY(consumer_account, accounts.create(consumer));
    log()->info("provider {} account {}", provider.toHex(),
                provider_account.toHex());
    log()->info("consumer {} account {}", consumer.toHex(),
                consumer_account.toHex());

    auto apps{std::make_shared<apps::AppRegistryImpl>()};
    OUTCOME_TRY(apps->registerApp(provider, "me"));

    auto handlers{std::make_shared<escrow::HandlerRegistry>()};
    auto events{std::make_shared<exchange::events::Events>()};
    auto connections{logEvents(*events)};
    auto orderbook{std::make_shared<exchange::ExchangeImpl>(
        config.exchange,
        clock,
        std::make_shared<exchange::InMemoryOfferStore>(),
        apps,
        handlers,
        events)};

    auto ledger{std::make_shared<token::TokenLedger>()};
    OUTCOME_TRY(ledger->mint(token_address, consumer, config.price * 10));
    OUTCOME_TRY(handlers->registerHandler(
        escrow_address,
        std::make_shared<token::TokenEscrow>(escrow_address, ledger,
                                             orderbook)));

    const auto call{token::TokenEscrow::makeCall(token_address, config.price)};
    OUTCOME_TRY(offer_id,
                orderbook->prepare(provider,
                                   "me",
                                   consumer,
                                   Escrow{escrow_address, call.selector,
                                          call.args},
                                   scenarioDataIds(config.data_ids)));
    counter->advance();
    OUTCOME_TRY(orderbook->order(provider, offer_id));
    counter->advance();

    switch (config.scenario) {
      case Scenario::kSettle:
      case Scenario::kRevert: {
        if (config.scenario == Scenario::kSettle) {
          ledger->approve(token_address, consumer, escrow_address,
                          config.price);
        }
        OUTCOME_TRY(settlement, orderbook->settle(consumer, offer_id));
        if (not settlement.succeeded()) {
          log()->warn("settlement failed: {}", *settlement.failure);
        }
        break;
      }
      case Scenario::kCancel: {
        OUTCOME_TRY(orderbook->cancel(provider, offer_id));
        break;
      }
      case Scenario::kReject: {
        OUTCOME_TRY(orderbook->reject(consumer, offer_id));
        break;
      }
    }

    OUTCOME_TRY(offer, orderbook->getOffer(offer_id));
    log()->info("offer {} is {} with {} data ids",
                offer_id.toHex(),
                exchange::toString(offer.status),
                offer.data_ids.size());
    log()->info("provider balance {}, consumer balance {}",
                ledger->balanceOf(token_address, provider),
                ledger->balanceOf(token_address, consumer));
    return outcome::success();
  }
}  // namespace datex

int main(int argc, char *argv[]) {
  try {
    auto config{datex::node::Config::read(argc, argv)};
    if (config.log_file) {
      datex::common::addFileSink(*config.log_file);
    }

    auto result{datex::main(config)};
    if (not result) {
      spdlog::error("datex node failed: {}", result.error().message());
      return EXIT_FAILURE;
    }
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
