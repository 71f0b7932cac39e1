#ifndef CHAINRELAY_COINPRICES_PRICE_ORACLE_HPP
#define CHAINRELAY_COINPRICES_PRICE_ORACLE_HPP

#include <map>
#include <string>
#include <vector>

#include "outcome/outcome.hpp"

namespace chainrelay::coinprices
{
    enum class PriceError
    {
        EmptyInput = 1,
        NetworkError,
        Timeout,
        HttpStatus,
        JsonParseError,
        NoDataFound,
        RateLimitExceeded
    };

    /**
     * Source of market prices. Implementations talk to third party services and
     * may fail at any time; callers decide how to degrade.
     */
    class PriceOracle
    {
    public:
        virtual ~PriceOracle() = default;

        /**
         * @brief Current USD price of each token
         * @param tokenIds provider specific ids, e.g. "ethereum"
         * @return prices keyed by token id; tokens without a quote are left out
         */
        virtual outcome::result<std::map<std::string, double>> getCurrentPrices(
            const std::vector<std::string> &tokenIds ) = 0;
    };
}

OUTCOME_HPP_DECLARE_ERROR_2( chainrelay::coinprices, PriceError );

#endif
