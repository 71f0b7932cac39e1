#include "validation/validation_pipeline.hpp"

#include <gtest/gtest.h>
#include "coinprices/price_oracle.hpp"
#include "mock/src/coinprices/price_oracle_mock.hpp"
#include "mock/src/validation/validation_rule_mock.hpp"
#include "testutil/bridge_events.hpp"
#include "validation/rules/completeness_rule.hpp"
#include "validation/rules/market_price_rule.hpp"
#include "validation/rules/minimum_amount_rule.hpp"

using namespace chainrelay;
using namespace chainrelay::validation;
using ::testing::_;
using ::testing::Return;
using ::testing::StrictMock;

class ValidationPipelineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        pipeline_ = std::make_shared<ValidationPipeline>( std::vector<std::shared_ptr<ValidationRule>>{
            std::make_shared<CompletenessRule>(),
            std::make_shared<MinimumAmountRule>( base::uint256_t( "10000000000000000" ) ),
            std::make_shared<MarketPriceRule>( oracle_, "ethereum", 1000.0 ) } );
    }

    static outcome::result<std::map<std::string, double>> price( double usd )
    {
        return std::map<std::string, double>{ { "ethereum", usd } };
    }

    std::shared_ptr<StrictMock<coinprices::PriceOracleMock>> oracle_ =
        std::make_shared<StrictMock<coinprices::PriceOracleMock>>();
    std::shared_ptr<ValidationPipeline> pipeline_;
};

/**
 * @given event below the minimum amount
 * @when validated
 * @then it fails with "below threshold" and the price feed is not asked
 */
TEST_F( ValidationPipelineTest, AmountBelowMinimumFails )
{
    auto verdict = pipeline_->validate( testutil::makeEvent( 1, base::uint256_t( "5000000000000000" ) ) );
    EXPECT_FALSE( verdict.passed );
    EXPECT_EQ( verdict.reason, std::optional<std::string>( reasons::kBelowThreshold ) );
}

TEST_F( ValidationPipelineTest, AmountEqualToMinimumPasses )
{
    EXPECT_CALL( *oracle_, getCurrentPrices( std::vector<std::string>{ "ethereum" } ) )
        .WillOnce( Return( price( 2000 ) ) );
    EXPECT_TRUE( pipeline_->validate( testutil::makeEvent( 1, base::uint256_t( "10000000000000000" ) ) ).passed );
}

/**
 * @given event without recipient
 * @when validated
 * @then it fails as malformed before any network call
 */
TEST_F( ValidationPipelineTest, MissingFieldFailsBeforeNetwork )
{
    auto event = testutil::makeEvent( 3 );
    event.to.reset();
    auto verdict = pipeline_->validate( event );
    EXPECT_FALSE( verdict.passed );
    EXPECT_EQ( verdict.reason, std::optional<std::string>( reasons::kMalformedEvent ) );

    auto no_nonce = testutil::makeEvent( 4 );
    no_nonce.nonce.reset();
    EXPECT_FALSE( pipeline_->validate( no_nonce ).passed );
}

TEST_F( ValidationPipelineTest, HealthyMarketPasses )
{
    EXPECT_CALL( *oracle_, getCurrentPrices( _ ) ).WillOnce( Return( price( 2000 ) ) );
    auto verdict = pipeline_->validate( testutil::makeEvent( 2 ) );
    EXPECT_TRUE( verdict.passed );
    EXPECT_FALSE( verdict.reason.has_value() );
}

TEST_F( ValidationPipelineTest, PriceBelowFloorFails )
{
    EXPECT_CALL( *oracle_, getCurrentPrices( _ ) ).WillOnce( Return( price( 999.99 ) ) );
    auto verdict = pipeline_->validate( testutil::makeEvent( 2 ) );
    EXPECT_FALSE( verdict.passed );
    EXPECT_EQ( verdict.reason, std::optional<std::string>( reasons::kMarketPrice ) );
}

/**
 * @given unreachable, throttled or empty price feed
 * @when an otherwise valid event is validated
 * @then it passes
 */
TEST_F( ValidationPipelineTest, PriceFeedFailureFailsOpen )
{
    EXPECT_CALL( *oracle_, getCurrentPrices( _ ) )
        .WillOnce( Return( outcome::result<std::map<std::string, double>>( coinprices::PriceError::Timeout ) ) )
        .WillOnce(
            Return( outcome::result<std::map<std::string, double>>( coinprices::PriceError::RateLimitExceeded ) ) )
        .WillOnce( Return( outcome::result<std::map<std::string, double>>( std::map<std::string, double>{} ) ) );

    EXPECT_TRUE( pipeline_->validate( testutil::makeEvent( 2 ) ).passed );
    EXPECT_TRUE( pipeline_->validate( testutil::makeEvent( 3 ) ).passed );
    EXPECT_TRUE( pipeline_->validate( testutil::makeEvent( 4 ) ).passed );
}

/**
 * @given three rules where the second fails
 * @when validated
 * @then the third is never consulted
 */
TEST( ValidationPipelineOrderTest, StopsAtFirstFailure )
{
    auto first  = std::make_shared<StrictMock<ValidationRuleMock>>();
    auto second = std::make_shared<StrictMock<ValidationRuleMock>>();
    auto third  = std::make_shared<StrictMock<ValidationRuleMock>>();
    EXPECT_CALL( *first, name() ).WillRepeatedly( Return( "first" ) );
    EXPECT_CALL( *second, name() ).WillRepeatedly( Return( "second" ) );
    {
        ::testing::InSequence seq;
        EXPECT_CALL( *first, check( _ ) ).WillOnce( Return( ValidationVerdict::pass() ) );
        EXPECT_CALL( *second, check( _ ) ).WillOnce( Return( ValidationVerdict::fail( "nope" ) ) );
    }

    ValidationPipeline pipeline( { first, second, third } );
    auto verdict = pipeline.validate( testutil::makeEvent( 9 ) );
    EXPECT_FALSE( verdict.passed );
    EXPECT_EQ( verdict.reason, std::optional<std::string>( "nope" ) );
}
