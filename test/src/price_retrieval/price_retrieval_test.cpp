#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include "api/transport/error.hpp"
#include "coinprices/coinprices.hpp"
#include "mock/src/api/http_client_mock.hpp"
#include "testutil/outcome.hpp"

using namespace chainrelay;
using coinprices::PriceError;
using ::testing::_;
using ::testing::Return;

class PriceRetrievalTest : public ::testing::Test
{
protected:
    static outcome::result<api::HttpResponse> reply( unsigned status, std::string body )
    {
        return api::HttpResponse{ status, std::move( body ) };
    }

    std::shared_ptr<api::HttpClientMock>  http_ = std::make_shared<api::HttpClientMock>();
    const std::chrono::milliseconds       timeout_{ 5000 };
    coinprices::CoinGeckoPriceRetriever   retriever_{ http_, timeout_, "https://prices.test/api/v3" };
};

TEST_F( PriceRetrievalTest, GetCurrentPrice )
{
    EXPECT_CALL( *http_, get( "https://prices.test/api/v3/simple/price?ids=ethereum,bitcoin&vs_currencies=usd",
                              timeout_ ) )
        .WillOnce( Return( reply( 200, R"({"ethereum":{"usd":3150.25},"bitcoin":{"usd":64000}})" ) ) );

    EXPECT_OUTCOME_TRUE( prices, retriever_.getCurrentPrices( { "ethereum", "bitcoin" } ) );
    ASSERT_EQ( prices.size(), 2 );
    EXPECT_DOUBLE_EQ( prices.at( "ethereum" ), 3150.25 );
    EXPECT_DOUBLE_EQ( prices.at( "bitcoin" ), 64000.0 );
}

TEST_F( PriceRetrievalTest, UnknownTokensAreLeftOut )
{
    EXPECT_CALL( *http_, get( _, timeout_ ) ).WillOnce( Return( reply( 200, R"({"ethereum":{"usd":2000}})" ) ) );

    EXPECT_OUTCOME_TRUE( prices, retriever_.getCurrentPrices( { "ethereum", "no-such-token" } ) );
    EXPECT_EQ( prices.count( "no-such-token" ), 0 );

    EXPECT_CALL( *http_, get( _, timeout_ ) ).WillOnce( Return( reply( 200, "{}" ) ) );
    EXPECT_OUTCOME_ERROR( retriever_.getCurrentPrices( { "no-such-token" } ), PriceError::NoDataFound );
}

TEST_F( PriceRetrievalTest, EmptyInput )
{
    EXPECT_CALL( *http_, get( _, _ ) ).Times( 0 );
    EXPECT_OUTCOME_ERROR( retriever_.getCurrentPrices( {} ), PriceError::EmptyInput );
}

/**
 * @given price feed throttling the caller, by status or in the body
 * @when prices are requested
 * @then rate limiting is reported as its own error
 */
TEST_F( PriceRetrievalTest, RateLimitIsDetected )
{
    EXPECT_CALL( *http_, get( _, timeout_ ) )
        .WillOnce( Return( reply( 429, "Too Many Requests" ) ) )
        .WillOnce( Return( reply( 200, R"({"status":{"error_code":429,"error_message":"Throttled"}})" ) ) );

    EXPECT_OUTCOME_ERROR( retriever_.getCurrentPrices( { "ethereum" } ), PriceError::RateLimitExceeded );
    EXPECT_OUTCOME_ERROR( retriever_.getCurrentPrices( { "ethereum" } ), PriceError::RateLimitExceeded );
}

TEST_F( PriceRetrievalTest, TransportAndFormatFailures )
{
    EXPECT_CALL( *http_, get( _, timeout_ ) )
        .WillOnce( Return( outcome::result<api::HttpResponse>( api::HttpError::TIMEOUT ) ) )
        .WillOnce( Return( outcome::result<api::HttpResponse>( api::HttpError::RESOLVE_FAILED ) ) )
        .WillOnce( Return( reply( 503, "Service Unavailable" ) ) )
        .WillOnce( Return( reply( 200, "not json" ) ) );

    EXPECT_OUTCOME_ERROR( retriever_.getCurrentPrices( { "ethereum" } ), PriceError::Timeout );
    EXPECT_OUTCOME_ERROR( retriever_.getCurrentPrices( { "ethereum" } ), PriceError::NetworkError );
    EXPECT_OUTCOME_ERROR( retriever_.getCurrentPrices( { "ethereum" } ), PriceError::HttpStatus );
    EXPECT_OUTCOME_ERROR( retriever_.getCurrentPrices( { "ethereum" } ), PriceError::JsonParseError );
}
