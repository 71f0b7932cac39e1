#ifndef CHAINRELAY_APPLICATION_CONFIG_LOADER_HPP
#define CHAINRELAY_APPLICATION_CONFIG_LOADER_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "application/bridge_config.hpp"
#include "application/impl/config_reader/error.hpp"
#include "base/logger.hpp"
#include "crypto/secp256k1/secp256k1_provider.hpp"

namespace chainrelay::application
{
    /// "trace", "debug", "info", "warn", "error", "critical" or "off"
    outcome::result<spdlog::level::level_enum> parseLogLevel( std::string_view name );

    using EnvironmentReader = std::function<std::optional<std::string>( const std::string & )>;

    /**
     * @brief Builds a BridgeConfig from its sources. Later sources override
     * earlier ones: built-in defaults, JSON config file, environment
     * variables, then command line flags (applied by the caller).
     */
    class ConfigLoader
    {
    public:
        /**
         * @brief Applies the members present in a JSON document
         */
        outcome::result<void> applyJson( std::string_view json, BridgeConfig &config ) const;

        outcome::result<void> applyFile( const std::string &path, BridgeConfig &config ) const;

        /**
         * @brief Applies SOURCE_RPC, SOURCE_CHAIN_ID, SOURCE_BRIDGE_CONTRACT,
         * SOURCE_BRIDGE_ABI, DEST_RPC, DEST_CHAIN_ID, DEST_BRIDGE_CONTRACT,
         * DEST_BRIDGE_ABI, EVENT_TO_LISTEN, POLLING_INTERVAL,
         * VALIDATOR_ADDRESS and VALIDATOR_PRIVATE_KEY
         * @param getenv lookup, std::getenv based when empty
         */
        outcome::result<void> applyEnvironment( BridgeConfig &config, const EnvironmentReader &getenv = {} ) const;

        /**
         * @brief Fails fast on placeholders, malformed addresses or ABIs,
         * missing event or functions, non-positive intervals, a malformed
         * private key or one that does not match the validator address.
         * The offending entry is logged, never the key itself.
         */
        outcome::result<void> validate( const BridgeConfig &config, const crypto::Secp256k1Provider &provider ) const;

        /// Overwrites the private key text in place
        static void wipeSecret( BridgeConfig &config );

    private:
        base::Logger logger_ = base::createLogger( "Config" );
    };
}

#endif // CHAINRELAY_APPLICATION_CONFIG_LOADER_HPP
