#include "watcher/event_poller.hpp"

#include <future>

#include <gtest/gtest.h>
#include "mock/src/chain/chain_link_mock.hpp"
#include "mock/src/chain/contract_handle_mock.hpp"
#include "mock/src/chain/log_filter_mock.hpp"
#include "mock/src/clock/clock_mock.hpp"
#include "mock/src/clock/manual_sleeper.hpp"
#include "mock/src/relay/relay_executor_mock.hpp"
#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "relay/impl/relay_executor_impl.hpp"
#include "testutil/bridge_events.hpp"
#include "testutil/log_capture.hpp"
#include "validation/rules/completeness_rule.hpp"
#include "validation/rules/minimum_amount_rule.hpp"

using namespace chainrelay;
using namespace chainrelay::watcher;
using namespace std::chrono_literals;
using chain::ChainLinkError;
using relay::RelayError;
using ::testing::_;
using ::testing::Eq;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;

namespace {

  MATCHER_P(HasNonce, nonce, "") {
    return arg.nonce == std::optional<base::uint256_t>(nonce);
  }

  chain::EventLog makeLog(uint64_t nonce, uint64_t block,
                          const char *amount = "20000000000000000") {
    chain::EventLog log;
    log.block_number = block;
    log.transaction_hash.fill(static_cast<uint8_t>(nonce));
    log.args["from"] = testutil::kSender;
    log.args["to"] = testutil::kRecipient;
    log.args["amount"] = base::uint256_t(amount);
    log.args["nonce"] = base::uint256_t(nonce);
    return log;
  }

  using Logs = std::vector<chain::EventLog>;

  outcome::result<relay::RelayReceipt> submitted() {
    return relay::RelayReceipt{};
  }

}  // namespace

class EventPollerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(*source_, connect()).WillByDefault(Return(outcome::success()));
    ON_CALL(*source_, isConnected()).WillByDefault(Return(true));
    ON_CALL(*source_, chainId()).WillByDefault(Return(5));
    ON_CALL(*source_, latestBlock()).WillByDefault(Return(100));
    ON_CALL(*source_, bindContract(_, _))
        .WillByDefault(
            Return(std::shared_ptr<chain::ContractHandle>(source_contract_)));
    ON_CALL(*destination_, connect()).WillByDefault(Return(outcome::success()));
    ON_CALL(*destination_, isConnected()).WillByDefault(Return(true));

    ON_CALL(*source_contract_, createEventFilter(_, _))
        .WillByDefault(Return(std::shared_ptr<chain::LogFilter>(filter_)));
    ON_CALL(*filter_, getNewEntries()).WillByDefault(Return(Logs{}));

    ON_CALL(*executor_, prepare()).WillByDefault(Return(outcome::success()));
    ON_CALL(*executor_, relay(_)).WillByDefault(Return(submitted()));

    ON_CALL(*clock_, now())
        .WillByDefault(Return(clock::SystemClock::TimePoint(1000s)));

    config_.poll_interval = 12s;
    config_.reconnect_backoff = 1s;
    config_.max_reconnect_backoff = 8s;
    config_.relay_retry_limit = 3;
  }

  std::shared_ptr<EventPoller> makePoller(
      std::shared_ptr<relay::RelayExecutor> executor = nullptr) {
    auto pipeline = std::make_shared<validation::ValidationPipeline>(
        std::vector<std::shared_ptr<validation::ValidationRule>>{
            std::make_shared<validation::CompletenessRule>(),
            std::make_shared<validation::MinimumAmountRule>(
                base::uint256_t("10000000000000000"))});
    return std::make_shared<EventPoller>(config_,
                                         source_,
                                         destination_,
                                         pipeline,
                                         executor ? executor : executor_,
                                         sleeper_,
                                         clock_);
  }

  PollerConfig config_;
  std::shared_ptr<NiceMock<chain::ChainLinkMock>> source_ =
      std::make_shared<NiceMock<chain::ChainLinkMock>>();
  std::shared_ptr<NiceMock<chain::ChainLinkMock>> destination_ =
      std::make_shared<NiceMock<chain::ChainLinkMock>>();
  std::shared_ptr<NiceMock<chain::ContractHandleMock>> source_contract_ =
      std::make_shared<NiceMock<chain::ContractHandleMock>>();
  std::shared_ptr<NiceMock<chain::LogFilterMock>> filter_ =
      std::make_shared<NiceMock<chain::LogFilterMock>>();
  std::shared_ptr<NiceMock<relay::RelayExecutorMock>> executor_ =
      std::make_shared<NiceMock<relay::RelayExecutorMock>>();
  std::shared_ptr<clock::ManualSleeper> sleeper_ =
      std::make_shared<clock::ManualSleeper>();
  std::shared_ptr<NiceMock<clock::SystemClockMock>> clock_ =
      std::make_shared<NiceMock<clock::SystemClockMock>>();
};

/**
 * @given reachable chains
 * @when the poller takes its first step
 * @then a filter from the chain head is installed and the poller polls
 */
TEST_F(EventPollerTest, SetupEntersPolling) {
  EXPECT_CALL(*source_contract_,
              createEventFilter("TokensLocked",
                                Eq(std::optional<uint64_t>{})));
  EXPECT_CALL(*executor_, prepare());

  auto poller = makePoller();
  EXPECT_EQ(poller->state(), PollerState::Idle);
  EXPECT_TRUE(poller->step());
  EXPECT_EQ(poller->state(), PollerState::Polling);
}

TEST_F(EventPollerTest, FailedSetupStartsReconnecting) {
  EXPECT_CALL(*destination_, connect())
      .WillOnce(Return(outcome::result<void>(ChainLinkError::CONNECTION_FAILED)));
  auto poller = makePoller();
  poller->step();
  EXPECT_EQ(poller->state(), PollerState::Reconnecting);
  EXPECT_EQ(poller->reconnectState().consecutive_failures, 1);
}

/**
 * @given two entries in one poll
 * @when the poll is processed
 * @then they are relayed in log order and the loop sleeps one interval
 */
TEST_F(EventPollerTest, RelaysInLogOrder) {
  EXPECT_CALL(*filter_, getNewEntries())
      .WillOnce(Return(Logs{makeLog(1, 101), makeLog(2, 102)}));
  {
    InSequence order;
    EXPECT_CALL(*executor_, relay(HasNonce(1))).WillOnce(Return(submitted()));
    EXPECT_CALL(*executor_, relay(HasNonce(2))).WillOnce(Return(submitted()));
  }

  auto poller = makePoller();
  poller->step();
  poller->step();

  EXPECT_EQ(poller->state(), PollerState::Polling);
  EXPECT_EQ(poller->resumeBlock(), std::optional<uint64_t>(102));
  ASSERT_TRUE(poller->reconnectState().last_successful_poll.has_value());
  EXPECT_EQ(sleeper_->delays(),
            std::vector<std::chrono::milliseconds>{12s});
}

TEST_F(EventPollerTest, RejectedEventsAreNotRelayed) {
  auto malformed = makeLog(3, 101);
  malformed.args.erase("to");
  EXPECT_CALL(*filter_, getNewEntries())
      .WillOnce(Return(Logs{makeLog(1, 101, "5000000000000000"), malformed}));
  EXPECT_CALL(*executor_, relay(_)).Times(0);

  auto poller = makePoller();
  poller->step();
  poller->step();
  EXPECT_EQ(poller->state(), PollerState::Polling);
  EXPECT_EQ(poller->pendingCount(), 0);
}

/**
 * @given source node failing after one relayed event
 * @when the poller goes through Reconnecting
 * @then the new filter starts at the last seen block, polling resumes and
 * the failure count is reset by the next good poll
 */
TEST_F(EventPollerTest, SourceFailureReconnectsAndResumes) {
  EXPECT_CALL(*filter_, getNewEntries())
      .WillOnce(Return(Logs{makeLog(1, 101)}))
      .WillOnce(Return(outcome::result<Logs>(ChainLinkError::FILTER_NOT_FOUND)))
      .WillRepeatedly(Return(Logs{}));
  EXPECT_CALL(*executor_, relay(HasNonce(1))).Times(1);
  {
    InSequence filters;
    EXPECT_CALL(*source_contract_,
                createEventFilter(_, Eq(std::optional<uint64_t>{})));
    EXPECT_CALL(*source_contract_,
                createEventFilter(_, Eq(std::optional<uint64_t>(101))));
  }

  auto poller = makePoller();
  poller->step();  // setup
  poller->step();  // relays nonce 1
  poller->step();  // filter lost
  EXPECT_EQ(poller->state(), PollerState::Reconnecting);
  EXPECT_EQ(poller->reconnectState().consecutive_failures, 1);

  poller->step();  // backoff and setup
  EXPECT_EQ(poller->state(), PollerState::Polling);
  EXPECT_EQ(poller->reconnectState().consecutive_failures, 1);

  poller->step();
  EXPECT_EQ(poller->reconnectState().consecutive_failures, 0);
  EXPECT_EQ(sleeper_->delays(),
            (std::vector<std::chrono::milliseconds>{12s, 1s, 12s}));
}

TEST_F(EventPollerTest, FailedReconnectDoublesBackoff) {
  EXPECT_CALL(*filter_, getNewEntries())
      .WillOnce(Return(outcome::result<Logs>(ChainLinkError::FILTER_NOT_FOUND)));
  EXPECT_CALL(*source_, connect())
      .WillOnce(Return(outcome::success()))
      .WillOnce(Return(outcome::result<void>(ChainLinkError::CONNECTION_FAILED)))
      .WillOnce(Return(outcome::result<void>(ChainLinkError::CONNECTION_FAILED)))
      .WillRepeatedly(Return(outcome::success()));

  auto poller = makePoller();
  poller->step();
  poller->step();
  poller->step();
  poller->step();
  EXPECT_EQ(poller->state(), PollerState::Reconnecting);
  EXPECT_EQ(poller->reconnectState().consecutive_failures, 3);
  poller->step();
  EXPECT_EQ(poller->state(), PollerState::Polling);
  EXPECT_EQ(sleeper_->delays(),
            (std::vector<std::chrono::milliseconds>{1s, 2s, 4s}));
}

/**
 * @given destination that is down while two events arrive
 * @when the poller reconnects
 * @then both events are retried in order before new logs are read
 */
TEST_F(EventPollerTest, UnavailableDestinationQueuesEvents) {
  EXPECT_CALL(*filter_, getNewEntries())
      .WillOnce(Return(Logs{makeLog(1, 101), makeLog(2, 102)}))
      .WillRepeatedly(Return(Logs{}));
  {
    InSequence order;
    EXPECT_CALL(*executor_, relay(HasNonce(1)))
        .WillOnce(Return(outcome::result<relay::RelayReceipt>(
            RelayError::DESTINATION_UNAVAILABLE)));
    EXPECT_CALL(*executor_, relay(HasNonce(1))).WillOnce(Return(submitted()));
    EXPECT_CALL(*executor_, relay(HasNonce(2))).WillOnce(Return(submitted()));
  }

  auto poller = makePoller();
  poller->step();
  poller->step();
  EXPECT_EQ(poller->state(), PollerState::Reconnecting);
  EXPECT_EQ(poller->pendingCount(), 2);

  poller->step();
  poller->step();
  EXPECT_EQ(poller->state(), PollerState::Polling);
  EXPECT_EQ(poller->pendingCount(), 0);
}

/**
 * @given destination rejecting every submission
 * @when the event has failed the retry limit
 * @then it is reported dropped only then and the poller keeps polling
 */
TEST_F(EventPollerTest, SubmissionFailuresEscalateAfterLimit) {
  EXPECT_CALL(*filter_, getNewEntries())
      .WillOnce(Return(Logs{makeLog(1, 101)}))
      .WillRepeatedly(Return(Logs{}));
  EXPECT_CALL(*executor_, relay(HasNonce(1)))
      .Times(3)
      .WillRepeatedly(Return(outcome::result<relay::RelayReceipt>(
          RelayError::SUBMISSION_REJECTED)));

  testutil::LogCapture logs("EventPoller");
  auto poller = makePoller();
  poller->step();
  poller->step();
  EXPECT_EQ(poller->pendingCount(), 1);
  poller->step();
  EXPECT_EQ(poller->pendingCount(), 1);
  EXPECT_EQ(logs.count("DROPPED BRIDGE ACTION"), 0);
  poller->step();
  EXPECT_EQ(poller->pendingCount(), 0);
  EXPECT_EQ(logs.count(spdlog::level::critical, "DROPPED BRIDGE ACTION"), 1);
  poller->step();
  EXPECT_EQ(poller->state(), PollerState::Polling);
}

TEST_F(EventPollerTest, BackoffDoublesUpToCeiling) {
  auto poller = makePoller();
  EXPECT_EQ(poller->backoffFor(0), 1s);
  EXPECT_EQ(poller->backoffFor(1), 1s);
  EXPECT_EQ(poller->backoffFor(2), 2s);
  EXPECT_EQ(poller->backoffFor(3), 4s);
  EXPECT_EQ(poller->backoffFor(4), 8s);
  EXPECT_EQ(poller->backoffFor(10), 8s);
}

TEST_F(EventPollerTest, CeilingBelowBaseKeepsBase) {
  config_.reconnect_backoff = 15s;
  config_.max_reconnect_backoff = 5s;
  auto poller = makePoller();
  EXPECT_EQ(poller->backoffFor(1), 15s);
  EXPECT_EQ(poller->backoffFor(4), 15s);
}

TEST_F(EventPollerTest, StoppedPollerDoesNotStep) {
  auto poller = makePoller();
  poller->stop();
  EXPECT_FALSE(poller->step());
  EXPECT_EQ(poller->state(), PollerState::Stopped);
}

/**
 * @given started poller
 * @when it is stopped after its first poll
 * @then the thread finishes and the poller reports Stopped
 */
TEST_F(EventPollerTest, StartAndStop) {
  std::promise<void> polled;
  std::atomic<bool> signalled{false};
  sleeper_->onSleep([&] {
    if (!signalled.exchange(true)) {
      polled.set_value();
    }
  });

  auto poller = makePoller();
  poller->start();
  EXPECT_TRUE(poller->isRunning());
  ASSERT_EQ(polled.get_future().wait_for(5s), std::future_status::ready);

  poller->stop();
  EXPECT_FALSE(poller->isRunning());
  EXPECT_EQ(poller->state(), PollerState::Stopped);
}

/**
 * Poller driving the real relay executor against a mocked destination chain
 */
class EventPollerRedeliveryTest : public EventPollerTest {
 protected:
  void SetUp() override {
    EventPollerTest::SetUp();

    ON_CALL(*destination_, chainId()).WillByDefault(Return(97));
    ON_CALL(*destination_, bindContract(_, _))
        .WillByDefault(
            Return(std::shared_ptr<chain::ContractHandle>(destination_contract_)));
    ON_CALL(*destination_, gasPrice())
        .WillByDefault(Return(base::uint256_t(10000000000ull)));
    ON_CALL(*destination_, transactionCount(_))
        .WillByDefault(Return(base::uint256_t(7)));
    ON_CALL(*destination_, lastNodeError())
        .WillByDefault(Return(std::optional<std::string>{}));

    ON_CALL(*destination_contract_, address()).WillByDefault(ReturnRef(kContract));
    // the mint is never mined during the test, the predicate stays false
    ON_CALL(*destination_contract_, call("processedNonces", _))
        .WillByDefault(Return(std::vector<eth::AbiValue>{eth::AbiValue(false)}));
    ON_CALL(*destination_contract_, encodeCall("mint", _))
        .WillByDefault(Return(std::vector<uint8_t>{0x40, 0xc1, 0x0f, 0x19}));

    auto key = crypto::SecretKey::fromHex(
        "0000000000000000000000000000000000000000000000000000000000000001");
    ASSERT_TRUE(key);
    auto identity = relay::ValidatorIdentity::create(
        std::move(key.value()),
        std::make_shared<crypto::Secp256k1ProviderImpl>());
    ASSERT_TRUE(identity);

    relay::RelayConfig relay_config;
    relay_config.contract = kContract;
    relay_executor_ = std::make_shared<relay::RelayExecutorImpl>(
        relay_config,
        destination_,
        identity.value(),
        std::make_shared<relay::RecentNonceCache>(16));
  }

  const eth::Address kContract =
      "0x00000000000000000000000000000000000000cc"_address;
  const base::Hash256 kTxHash =
      "1111111111111111111111111111111111111111111111111111111111111111"_hash256;

  std::shared_ptr<NiceMock<chain::ContractHandleMock>> destination_contract_ =
      std::make_shared<NiceMock<chain::ContractHandleMock>>();
  std::shared_ptr<relay::RelayExecutorImpl> relay_executor_;
};

/**
 * @given source filter lost after nonce 1 was relayed, and the re-created
 * filter delivering nonce 1 again together with nonce 2
 * @when the poller reconnects and polls
 * @then nonce 1 is submitted once, nonce 2 once, and nothing is queued
 */
TEST_F(EventPollerRedeliveryTest, RedeliveredEventIsSubmittedOnce) {
  EXPECT_CALL(*filter_, getNewEntries())
      .WillOnce(Return(Logs{makeLog(1, 101)}))
      .WillOnce(Return(outcome::result<Logs>(ChainLinkError::FILTER_NOT_FOUND)))
      .WillOnce(Return(Logs{makeLog(1, 101), makeLog(2, 103)}))
      .WillRepeatedly(Return(Logs{}));
  {
    InSequence filters;
    EXPECT_CALL(*source_contract_,
                createEventFilter(_, Eq(std::optional<uint64_t>{})));
    EXPECT_CALL(*source_contract_,
                createEventFilter(_, Eq(std::optional<uint64_t>(101))));
  }
  EXPECT_CALL(*destination_, sendRawTransaction(_))
      .Times(2)
      .WillRepeatedly(Return(kTxHash));

  auto poller = makePoller(relay_executor_);
  poller->step();  // setup
  poller->step();  // relays nonce 1
  poller->step();  // filter lost
  EXPECT_EQ(poller->state(), PollerState::Reconnecting);
  poller->step();  // setup from block 101
  poller->step();  // nonce 1 again, nonce 2
  poller->step();

  EXPECT_EQ(poller->state(), PollerState::Polling);
  EXPECT_EQ(poller->pendingCount(), 0);
  EXPECT_EQ(poller->resumeBlock(), std::optional<uint64_t>(103));
}
