#include "validation/rules/market_price_rule.hpp"

namespace chainrelay::validation
{
    MarketPriceRule::MarketPriceRule( std::shared_ptr<coinprices::PriceOracle> oracle, std::string asset,
                                      double floor_usd ) :
        oracle_( std::move( oracle ) ), asset_( std::move( asset ) ), floor_usd_( floor_usd )
    {
    }

    ValidationVerdict MarketPriceRule::check( const primitives::BridgeEvent &event )
    {
        auto prices = oracle_->getCurrentPrices( { asset_ } );
        if ( !prices )
        {
            logger_->warn( "ExternalServiceDegraded: price feed unavailable ({}), accepting nonce {}",
                           prices.error().message(), event.nonceText() );
            return ValidationVerdict::pass();
        }

        auto it = prices.value().find( asset_ );
        if ( it == prices.value().end() )
        {
            logger_->warn( "ExternalServiceDegraded: no {} quote in price feed answer, accepting nonce {}", asset_,
                           event.nonceText() );
            return ValidationVerdict::pass();
        }

        logger_->debug( "{} price {} USD, floor {} USD", asset_, it->second, floor_usd_ );
        if ( it->second < floor_usd_ )
        {
            return ValidationVerdict::fail( reasons::kMarketPrice );
        }
        return ValidationVerdict::pass();
    }
}
