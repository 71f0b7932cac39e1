#include "relay/impl/relay_executor_impl.hpp"

#include <gtest/gtest.h>
#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"
#include "eth/rlp.hpp"
#include "eth/transaction.hpp"
#include "mock/src/chain/chain_link_mock.hpp"
#include "mock/src/chain/contract_handle_mock.hpp"
#include "testutil/bridge_events.hpp"
#include "testutil/literals.hpp"
#include "testutil/log_capture.hpp"
#include "testutil/outcome.hpp"

using namespace chainrelay;
using namespace chainrelay::relay;
using chain::ChainLinkError;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;
using ::testing::SaveArg;

namespace {

  std::vector<eth::AbiValue> flag(bool value) {
    return {eth::AbiValue(value)};
  }

  base::Blob<32> padScalar(const std::vector<uint8_t> &bytes) {
    base::Blob<32> out;
    std::copy(bytes.begin(), bytes.end(), out.end() - bytes.size());
    return out;
  }

}  // namespace

class RelayExecutorTest : public ::testing::Test {
 protected:
  static constexpr uint64_t kDestinationChain = 97;

  void SetUp() override {
    auto key = crypto::SecretKey::fromHex(
        "0000000000000000000000000000000000000000000000000000000000000001");
    ASSERT_TRUE(key);
    auto identity = ValidatorIdentity::create(std::move(key.value()), provider_);
    ASSERT_TRUE(identity);
    identity_ = identity.value();

    ON_CALL(*link_, isConnected()).WillByDefault(Return(true));
    ON_CALL(*link_, chainId()).WillByDefault(Return(kDestinationChain));
    ON_CALL(*link_, bindContract(_, _))
        .WillByDefault(
            Return(std::shared_ptr<chain::ContractHandle>(contract_)));
    ON_CALL(*link_, gasPrice())
        .WillByDefault(Return(base::uint256_t(10000000000ull)));
    ON_CALL(*link_, transactionCount(_))
        .WillByDefault(Return(base::uint256_t(7)));
    ON_CALL(*link_, sendRawTransaction(_)).WillByDefault(Return(kTxHash));
    ON_CALL(*link_, lastNodeError())
        .WillByDefault(Return(std::optional<std::string>{}));

    ON_CALL(*contract_, address()).WillByDefault(ReturnRef(kContract));
    ON_CALL(*contract_, call("processedNonces", _))
        .WillByDefault(Return(flag(false)));
    ON_CALL(*contract_, encodeCall("mint", _))
        .WillByDefault(Return(kCalldata));

    RelayConfig config;
    config.contract = kContract;
    executor_ = std::make_shared<RelayExecutorImpl>(
        config, link_, identity_, cache_);
    ASSERT_TRUE(executor_->prepare());
  }

  const eth::Address kContract =
      "0x00000000000000000000000000000000000000cc"_address;
  const base::Hash256 kTxHash =
      "1111111111111111111111111111111111111111111111111111111111111111"_hash256;
  const std::vector<uint8_t> kCalldata = "40c10f19"_unhex;

  std::shared_ptr<crypto::Secp256k1ProviderImpl> provider_ =
      std::make_shared<crypto::Secp256k1ProviderImpl>();
  std::shared_ptr<NiceMock<chain::ChainLinkMock>> link_ =
      std::make_shared<NiceMock<chain::ChainLinkMock>>();
  std::shared_ptr<NiceMock<chain::ContractHandleMock>> contract_ =
      std::make_shared<NiceMock<chain::ContractHandleMock>>();
  std::shared_ptr<RecentNonceCache> cache_ =
      std::make_shared<RecentNonceCache>(16);
  std::shared_ptr<ValidatorIdentity> identity_;
  std::shared_ptr<RelayExecutorImpl> executor_;
};

/**
 * @given connected destination that has not processed nonce 2
 * @when the event is relayed
 * @then one mint transaction is signed by the validator for the
 * destination chain and sent
 */
TEST_F(RelayExecutorTest, SubmitsSignedMint) {
  auto event = testutil::makeEvent(2);
  std::vector<uint8_t> raw;
  EXPECT_CALL(*contract_,
              encodeCall("mint",
                         ElementsAre(eth::AbiValue(*event.to),
                                     eth::AbiValue(*event.amount),
                                     eth::AbiValue(*event.nonce))))
      .WillOnce(Return(kCalldata));
  EXPECT_CALL(*link_, sendRawTransaction(_))
      .WillOnce(::testing::DoAll(SaveArg<0>(&raw), Return(kTxHash)));

  EXPECT_OUTCOME_TRUE(receipt, executor_->relay(event));
  EXPECT_EQ(receipt.status, RelayStatus::SUBMITTED);
  EXPECT_EQ(receipt.tx_hash, std::optional<base::Hash256>(kTxHash));
  EXPECT_EQ(receipt.request.recipient, testutil::kRecipient);
  EXPECT_EQ(receipt.request.source_nonce, base::uint256_t(2));

  EXPECT_OUTCOME_TRUE(decoded, eth::rlp::decode(raw));
  ASSERT_TRUE(decoded.is_list);
  ASSERT_EQ(decoded.items.size(), 9);
  EXPECT_OUTCOME_TRUE(account_nonce, decoded.items[0].asInteger());
  EXPECT_EQ(account_nonce, base::uint256_t(7));
  EXPECT_EQ(decoded.items[3].bytes,
            std::vector<uint8_t>(kContract.begin(), kContract.end()));
  EXPECT_EQ(decoded.items[5].bytes, kCalldata);
  EXPECT_OUTCOME_TRUE(v, decoded.items[6].asInteger());
  EXPECT_TRUE(v == kDestinationChain * 2 + 35
              || v == kDestinationChain * 2 + 36);

  eth::LegacyTransaction tx;
  tx.nonce = 7;
  tx.gas_price = base::uint256_t(10000000000ull);
  tx.gas_limit = 200000;
  tx.to = kContract;
  tx.value = 0;
  tx.data = kCalldata;
  tx.chain_id = kDestinationChain;
  crypto::secp256k1::RecoverableSignature signature;
  signature.r = padScalar(decoded.items[7].bytes);
  signature.s = padScalar(decoded.items[8].bytes);
  signature.recovery_id =
      static_cast<uint8_t>(v - (kDestinationChain * 2 + 35));
  EXPECT_OUTCOME_TRUE(signer,
                      provider_->recoverPublicKey(tx.signingHash(), signature));
  EXPECT_EQ(eth::addressFromPublicKey(signer), identity_->address());
}

/**
 * @given event already submitted by this relayer
 * @when it is relayed again
 * @then no second transaction is sent
 */
TEST_F(RelayExecutorTest, SecondRelayOfSameNonceSendsOnce) {
  EXPECT_CALL(*link_, sendRawTransaction(_)).WillOnce(Return(kTxHash));

  EXPECT_OUTCOME_TRUE(first, executor_->relay(testutil::makeEvent(2)));
  EXPECT_OUTCOME_TRUE(second, executor_->relay(testutil::makeEvent(2)));
  EXPECT_EQ(first.status, RelayStatus::SUBMITTED);
  EXPECT_EQ(second.status, RelayStatus::RECENTLY_SUBMITTED);
  EXPECT_EQ(second.tx_hash, first.tx_hash);
}

TEST_F(RelayExecutorTest, ProcessedNonceIsSkipped) {
  EXPECT_CALL(*contract_, call("processedNonces",
                               ElementsAre(eth::AbiValue(base::uint256_t(2)))))
      .WillOnce(Return(flag(true)));
  EXPECT_CALL(*link_, sendRawTransaction(_)).Times(0);

  EXPECT_OUTCOME_TRUE(receipt, executor_->relay(testutil::makeEvent(2)));
  EXPECT_EQ(receipt.status, RelayStatus::ALREADY_PROCESSED);
  EXPECT_FALSE(receipt.tx_hash.has_value());
}

/**
 * @given destination link that lost its session
 * @when an event is relayed
 * @then nothing is asked of the contract and the event is reported
 * undeliverable for now
 */
TEST_F(RelayExecutorTest, DisconnectedDestinationIsUnavailable) {
  ON_CALL(*link_, isConnected()).WillByDefault(Return(false));
  EXPECT_CALL(*contract_, call(_, _)).Times(0);
  EXPECT_CALL(*link_, sendRawTransaction(_)).Times(0);

  EXPECT_OUTCOME_ERROR(executor_->relay(testutil::makeEvent(2)),
                       RelayError::DESTINATION_UNAVAILABLE);
}

TEST_F(RelayExecutorTest, UnpreparedExecutorIsUnavailable) {
  RelayConfig config;
  config.contract = kContract;
  RelayExecutorImpl executor(config, link_, identity_, cache_);
  EXPECT_OUTCOME_ERROR(executor.relay(testutil::makeEvent(2)),
                       RelayError::DESTINATION_UNAVAILABLE);
}

TEST_F(RelayExecutorTest, PrepareFailsWithoutSession) {
  EXPECT_CALL(*link_, bindContract(_, _))
      .WillOnce(Return(outcome::result<std::shared_ptr<chain::ContractHandle>>(
          ChainLinkError::NOT_CONNECTED)));
  EXPECT_OUTCOME_ERROR(executor_->prepare(), ChainLinkError::NOT_CONNECTED);
}

TEST_F(RelayExecutorTest, FailedReplayCheckStopsRelay) {
  EXPECT_CALL(*contract_, call("processedNonces", _))
      .WillOnce(Return(outcome::result<std::vector<eth::AbiValue>>(
          ChainLinkError::CALL_FAILED)))
      .WillOnce(Return(std::vector<eth::AbiValue>{
          eth::AbiValue(base::uint256_t(1))}));
  EXPECT_CALL(*link_, sendRawTransaction(_)).Times(0);

  EXPECT_OUTCOME_ERROR(executor_->relay(testutil::makeEvent(2)),
                       RelayError::REPLAY_CHECK_FAILED);
  EXPECT_OUTCOME_ERROR(executor_->relay(testutil::makeEvent(2)),
                       RelayError::REPLAY_CHECK_FAILED);
}

TEST_F(RelayExecutorTest, IncompleteEventIsRefused) {
  auto event = testutil::makeEvent(2);
  event.amount.reset();
  EXPECT_CALL(*contract_, call(_, _)).Times(0);
  EXPECT_OUTCOME_ERROR(executor_->relay(event), RelayError::INCOMPLETE_EVENT);
}

TEST_F(RelayExecutorTest, GasPriceFailureIsBuildError) {
  EXPECT_CALL(*link_, gasPrice())
      .WillOnce(Return(outcome::result<base::uint256_t>(
          ChainLinkError::MALFORMED_RESPONSE)));
  EXPECT_CALL(*link_, sendRawTransaction(_)).Times(0);
  EXPECT_OUTCOME_ERROR(executor_->relay(testutil::makeEvent(2)),
                       RelayError::TRANSACTION_BUILD_FAILED);
}

struct SubmissionCase {
  ChainLinkError link_error;
  RelayError expected;
};

class RelaySubmissionErrorTest
    : public RelayExecutorTest,
      public ::testing::WithParamInterface<SubmissionCase> {};

/**
 * @given node failing the submission
 * @when an event is relayed
 * @then the failure is classified, reported as retryable and the nonce is
 * not remembered as sent
 */
TEST_P(RelaySubmissionErrorTest, ClassifiesAndForgets) {
  testutil::LogCapture logs("RelayExecutor");
  EXPECT_CALL(*link_, sendRawTransaction(_))
      .WillOnce(Return(
          outcome::result<base::Hash256>(GetParam().link_error)))
      .WillOnce(Return(kTxHash));
  EXPECT_OUTCOME_ERROR(executor_->relay(testutil::makeEvent(2)),
                       GetParam().expected);
  EXPECT_EQ(cache_->size(), 0);
  EXPECT_EQ(logs.count(spdlog::level::critical, ""), 0);
  EXPECT_EQ(logs.count("DROPPED BRIDGE ACTION"), 0);

  EXPECT_OUTCOME_TRUE(receipt, executor_->relay(testutil::makeEvent(2)));
  EXPECT_EQ(receipt.status, RelayStatus::SUBMITTED);
}

INSTANTIATE_TEST_SUITE_P(
    NodeAnswers,
    RelaySubmissionErrorTest,
    ::testing::Values(
        SubmissionCase{ChainLinkError::NONCE_TOO_LOW,
                       RelayError::SUBMISSION_NONCE_TOO_LOW},
        SubmissionCase{ChainLinkError::INSUFFICIENT_FUNDS,
                       RelayError::SUBMISSION_INSUFFICIENT_FUNDS},
        SubmissionCase{ChainLinkError::TRANSACTION_REJECTED,
                       RelayError::SUBMISSION_REJECTED},
        SubmissionCase{ChainLinkError::CALL_FAILED,
                       RelayError::DESTINATION_UNAVAILABLE},
        SubmissionCase{ChainLinkError::NOT_CONNECTED,
                       RelayError::DESTINATION_UNAVAILABLE}));

TEST(RelayErrorTest, Classification) {
  EXPECT_TRUE(isConnectivityError(
      make_error_code(RelayError::DESTINATION_UNAVAILABLE)));
  EXPECT_TRUE(
      isConnectivityError(make_error_code(RelayError::REPLAY_CHECK_FAILED)));
  EXPECT_FALSE(
      isConnectivityError(make_error_code(RelayError::SUBMISSION_REJECTED)));
  EXPECT_TRUE(
      isSubmissionError(make_error_code(RelayError::SUBMISSION_NONCE_TOO_LOW)));
  EXPECT_TRUE(isSubmissionError(make_error_code(RelayError::SIGNING_FAILED)));
  EXPECT_FALSE(
      isSubmissionError(make_error_code(RelayError::INCOMPLETE_EVENT)));
}
