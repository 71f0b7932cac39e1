#ifndef CHAINRELAY_APPLICATION_BRIDGE_CONFIG_HPP
#define CHAINRELAY_APPLICATION_BRIDGE_CONFIG_HPP

#include <chrono>
#include <string>

#include <spdlog/spdlog.h>

#include "application/default_abis.hpp"
#include "base/uint256.hpp"
#include "coinprices/coinprices.hpp"

namespace chainrelay::application
{
    struct ChainSettings
    {
        std::string rpc_url;
        uint64_t    chain_id = 0;
        std::string contract;
        std::string abi;
    };

    /**
     * Everything one bridge direction needs. Defaults are the demonstration
     * setup (Goerli to Mumbai) and contain placeholders that validation
     * rejects until they are replaced.
     */
    struct BridgeConfig
    {
        ChainSettings source{ "https://goerli.infura.io/v3/your_infura_id", 5, "0xSourceBridgeContractAddress",
                              kDefaultSourceAbi };
        ChainSettings destination{ "https://polygon-mumbai.infura.io/v3/your_infura_id", 80001,
                                   "0xDestinationBridgeContractAddress", kDefaultDestinationAbi };

        std::string          event_name = "TokensLocked";
        std::chrono::seconds poll_interval{ 12 };

        std::string validator_address     = "0xValidatorWalletAddress";
        std::string validator_private_key = "your_private_key_here";

        std::string     mint_function      = "mint";
        std::string     processed_function = "processedNonces";
        uint64_t        gas_limit          = 200000;
        base::uint256_t minimum_amount{ "10000000000000000" };

        std::string               price_feed_url = coinprices::CoinGeckoPriceRetriever::kDefaultBaseUrl;
        std::string               price_asset    = "ethereum";
        double                    price_floor_usd = 1000.0;
        std::chrono::milliseconds oracle_timeout{ 5000 };

        std::chrono::milliseconds rpc_timeout{ 10000 };
        std::chrono::seconds      reconnect_backoff{ 15 };
        std::chrono::seconds      max_reconnect_backoff{ 15 };
        uint32_t                  relay_retry_limit    = 3;
        size_t                    nonce_cache_capacity = 1024;

        spdlog::level::level_enum log_level = spdlog::level::info;
        std::string               log_file;
    };
}

#endif // CHAINRELAY_APPLICATION_BRIDGE_CONFIG_HPP
