#ifndef CHAINRELAY_VALIDATION_RULES_MARKET_PRICE_RULE_HPP
#define CHAINRELAY_VALIDATION_RULES_MARKET_PRICE_RULE_HPP

#include <memory>

#include "base/logger.hpp"
#include "coinprices/price_oracle.hpp"
#include "validation/validation_rule.hpp"

namespace chainrelay::validation
{
    /**
     * Rejects events while the market price of the watched asset is under a
     * floor. The feed is not trusted to be up: when it cannot answer, the
     * event passes and the degradation is logged.
     */
    class MarketPriceRule : public ValidationRule
    {
    public:
        MarketPriceRule( std::shared_ptr<coinprices::PriceOracle> oracle, std::string asset, double floor_usd );

        std::string name() const override
        {
            return "market price";
        }

        ValidationVerdict check( const primitives::BridgeEvent &event ) override;

    private:
        std::shared_ptr<coinprices::PriceOracle> oracle_;
        std::string                              asset_;
        double                                   floor_usd_;
        base::Logger                             logger_ = base::createLogger( "ValidationPipeline" );
    };
}

#endif // CHAINRELAY_VALIDATION_RULES_MARKET_PRICE_RULE_HPP
