#ifndef _COIN_PRICES_HPP_
#define _COIN_PRICES_HPP_
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <map>
#include "api/transport/http_client.hpp"
#include "base/logger.hpp"
#include "coinprices/price_oracle.hpp"

namespace chainrelay::coinprices
{
    class CoinGeckoPriceRetriever : public PriceOracle
    {
    public:
        static constexpr auto kDefaultBaseUrl = "https://api.coingecko.com/api/v3";

        CoinGeckoPriceRetriever( std::shared_ptr<api::HttpClient> http, std::chrono::milliseconds timeout,
                                 std::string baseUrl = kDefaultBaseUrl );

        // Get current prices for the specified tokens
        outcome::result<std::map<std::string, double>> getCurrentPrices(
            const std::vector<std::string> &tokenIds ) override;

    private:
        std::shared_ptr<api::HttpClient> m_http;
        std::chrono::milliseconds        m_timeout;
        std::string                      m_baseUrl;
        base::Logger                     m_logger = base::createLogger( "CoinPrices" );
    };
}

#endif
