#include "application/config_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <sstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <openssl/crypto.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "api/transport/url.hpp"
#include "crypto/secret_key.hpp"
#include "eth/abi.hpp"
#include "eth/address.hpp"

namespace chainrelay::application
{
    namespace
    {
        using JsonObject = rapidjson::Value;

        outcome::result<void> readString( const JsonObject &object, const char *key, std::string &out )
        {
            if ( !object.HasMember( key ) )
            {
                return outcome::success();
            }
            if ( !object[key].IsString() )
            {
                return ConfigError::INVALID_VALUE;
            }
            out = object[key].GetString();
            return outcome::success();
        }

        template <typename T>
        outcome::result<void> readUnsigned( const JsonObject &object, const char *key, T &out )
        {
            if ( !object.HasMember( key ) )
            {
                return outcome::success();
            }
            if ( !object[key].IsUint64() || object[key].GetUint64() > std::numeric_limits<T>::max() )
            {
                return ConfigError::INVALID_VALUE;
            }
            out = static_cast<T>( object[key].GetUint64() );
            return outcome::success();
        }

        template <typename Duration>
        outcome::result<void> readDuration( const JsonObject &object, const char *key, Duration &out )
        {
            if ( !object.HasMember( key ) )
            {
                return outcome::success();
            }
            if ( !object[key].IsInt64() )
            {
                return ConfigError::INVALID_VALUE;
            }
            out = Duration( object[key].GetInt64() );
            return outcome::success();
        }

        outcome::result<void> readDouble( const JsonObject &object, const char *key, double &out )
        {
            if ( !object.HasMember( key ) )
            {
                return outcome::success();
            }
            if ( !object[key].IsNumber() )
            {
                return ConfigError::INVALID_VALUE;
            }
            out = object[key].GetDouble();
            return outcome::success();
        }

        /// ABIs may be embedded as JSON or given as a JSON string
        outcome::result<void> readAbi( const JsonObject &object, const char *key, std::string &out )
        {
            if ( !object.HasMember( key ) )
            {
                return outcome::success();
            }
            const auto &abi = object[key];
            if ( abi.IsString() )
            {
                out = abi.GetString();
                return outcome::success();
            }
            if ( !abi.IsArray() )
            {
                return ConfigError::INVALID_VALUE;
            }
            rapidjson::StringBuffer                    buffer;
            rapidjson::Writer<rapidjson::StringBuffer> writer( buffer );
            abi.Accept( writer );
            out = buffer.GetString();
            return outcome::success();
        }

        outcome::result<void> readChain( const JsonObject &object, const char *key, ChainSettings &chain )
        {
            if ( !object.HasMember( key ) )
            {
                return outcome::success();
            }
            const auto &section = object[key];
            if ( !section.IsObject() )
            {
                return ConfigError::INVALID_VALUE;
            }
            for ( auto result : { readString( section, "rpc_url", chain.rpc_url ),
                                  readUnsigned( section, "chain_id", chain.chain_id ),
                                  readString( section, "contract", chain.contract ),
                                  readAbi( section, "abi", chain.abi ) } )
            {
                if ( !result )
                {
                    return result;
                }
            }
            return outcome::success();
        }

        template <typename T>
        outcome::result<T> parseNumber( const std::string &text )
        {
            T value{};
            if ( !boost::conversion::try_lexical_convert( text, value ) )
            {
                return ConfigError::INVALID_VALUE;
            }
            return value;
        }

        bool isPlaceholderAddress( const std::string &address )
        {
            return boost::algorithm::ends_with( address, "Address" );
        }
    } // namespace

    outcome::result<spdlog::level::level_enum> parseLogLevel( std::string_view name )
    {
        static const std::pair<std::string_view, spdlog::level::level_enum> kLevels[] = {
            { "trace", spdlog::level::trace }, { "debug", spdlog::level::debug },
            { "info", spdlog::level::info },   { "warn", spdlog::level::warn },
            { "error", spdlog::level::err },   { "critical", spdlog::level::critical },
            { "off", spdlog::level::off } };
        for ( const auto &[level_name, level] : kLevels )
        {
            if ( level_name == name )
            {
                return level;
            }
        }
        return ConfigError::INVALID_VALUE;
    }

    outcome::result<void> ConfigLoader::applyJson( std::string_view json, BridgeConfig &config ) const
    {
        rapidjson::Document document;
        document.Parse( json.data(), json.size() );
        if ( document.HasParseError() )
        {
            logger_->error( "Config parse error at offset {}: {}", document.GetErrorOffset(),
                            rapidjson::GetParseError_En( document.GetParseError() ) );
            return ConfigError::PARSER_ERROR;
        }
        if ( !document.IsObject() )
        {
            logger_->error( "Config root must be a JSON object" );
            return ConfigError::PARSER_ERROR;
        }

        std::string minimum_amount;
        std::string log_level;
        uint64_t    rpc_timeout_ms = static_cast<uint64_t>( config.rpc_timeout.count() );

        std::vector<std::pair<const char *, outcome::result<void>>> results = {
            { "source", readChain( document, "source", config.source ) },
            { "destination", readChain( document, "destination", config.destination ) },
            { "event_name", readString( document, "event_name", config.event_name ) },
            { "poll_interval", readDuration( document, "poll_interval", config.poll_interval ) },
            { "validator_address", readString( document, "validator_address", config.validator_address ) },
            { "validator_private_key", readString( document, "validator_private_key", config.validator_private_key ) },
            { "mint_function", readString( document, "mint_function", config.mint_function ) },
            { "processed_function", readString( document, "processed_function", config.processed_function ) },
            { "gas_limit", readUnsigned( document, "gas_limit", config.gas_limit ) },
            { "minimum_amount", readString( document, "minimum_amount", minimum_amount ) },
            { "rpc_timeout_ms", readUnsigned( document, "rpc_timeout_ms", rpc_timeout_ms ) },
            { "reconnect_backoff", readDuration( document, "reconnect_backoff", config.reconnect_backoff ) },
            { "max_reconnect_backoff", readDuration( document, "max_reconnect_backoff", config.max_reconnect_backoff ) },
            { "relay_retry_limit", readUnsigned( document, "relay_retry_limit", config.relay_retry_limit ) },
            { "nonce_cache_capacity", readUnsigned( document, "nonce_cache_capacity", config.nonce_cache_capacity ) },
            { "log_level", readString( document, "log_level", log_level ) },
            { "log_file", readString( document, "log_file", config.log_file ) },
        };

        if ( document.HasMember( "price_feed" ) )
        {
            const auto &feed = document["price_feed"];
            if ( !feed.IsObject() )
            {
                results.emplace_back( "price_feed", outcome::result<void>{ ConfigError::INVALID_VALUE } );
            }
            else
            {
                results.emplace_back( "price_feed.url", readString( feed, "url", config.price_feed_url ) );
                results.emplace_back( "price_feed.asset", readString( feed, "asset", config.price_asset ) );
                results.emplace_back( "price_feed.floor_usd", readDouble( feed, "floor_usd", config.price_floor_usd ) );
                results.emplace_back( "price_feed.timeout_ms", readDuration( feed, "timeout_ms", config.oracle_timeout ) );
            }
        }

        for ( const auto &[key, result] : results )
        {
            if ( !result )
            {
                logger_->error( "Config entry '{}': {}", key, result.error().message() );
                return result;
            }
        }

        config.rpc_timeout = std::chrono::milliseconds( rpc_timeout_ms );
        if ( !minimum_amount.empty() )
        {
            auto amount = base::parseDecimal( minimum_amount );
            if ( !amount )
            {
                logger_->error( "Config entry 'minimum_amount': {}", amount.error().message() );
                return ConfigError::INVALID_VALUE;
            }
            config.minimum_amount = amount.value();
        }
        if ( !log_level.empty() )
        {
            auto level = parseLogLevel( log_level );
            if ( !level )
            {
                logger_->error( "Config entry 'log_level': unknown level {}", log_level );
                return level.as_failure();
            }
            config.log_level = level.value();
        }
        return outcome::success();
    }

    outcome::result<void> ConfigLoader::applyFile( const std::string &path, BridgeConfig &config ) const
    {
        std::ifstream file( path );
        if ( !file )
        {
            logger_->error( "Cannot open config file {}", path );
            return ConfigError::FILE_NOT_READABLE;
        }
        std::stringstream content;
        content << file.rdbuf();
        logger_->info( "Loading config file {}", path );
        return applyJson( content.str(), config );
    }

    outcome::result<void> ConfigLoader::applyEnvironment( BridgeConfig &config, const EnvironmentReader &getenv ) const
    {
        EnvironmentReader lookup = getenv;
        if ( !lookup )
        {
            lookup = []( const std::string &name ) -> std::optional<std::string>
            {
                const char *value = std::getenv( name.c_str() );
                if ( value == nullptr )
                {
                    return std::nullopt;
                }
                return std::string( value );
            };
        }

        auto text = [&]( const char *name, std::string &out )
        {
            if ( auto value = lookup( name ) )
            {
                out = *value;
            }
        };
        auto number = [&]( const char *name, auto &out ) -> outcome::result<void>
        {
            auto value = lookup( name );
            if ( !value )
            {
                return outcome::success();
            }
            auto parsed = parseNumber<std::decay_t<decltype( out )>>( *value );
            if ( !parsed )
            {
                logger_->error( "Environment variable {} is not a number", name );
                return parsed.as_failure();
            }
            out = parsed.value();
            return outcome::success();
        };

        text( "SOURCE_RPC", config.source.rpc_url );
        text( "SOURCE_BRIDGE_CONTRACT", config.source.contract );
        text( "SOURCE_BRIDGE_ABI", config.source.abi );
        text( "DEST_RPC", config.destination.rpc_url );
        text( "DEST_BRIDGE_CONTRACT", config.destination.contract );
        text( "DEST_BRIDGE_ABI", config.destination.abi );
        text( "EVENT_TO_LISTEN", config.event_name );
        text( "VALIDATOR_ADDRESS", config.validator_address );
        text( "VALIDATOR_PRIVATE_KEY", config.validator_private_key );

        int64_t poll_seconds = config.poll_interval.count();
        for ( auto result : { number( "SOURCE_CHAIN_ID", config.source.chain_id ),
                              number( "DEST_CHAIN_ID", config.destination.chain_id ),
                              number( "POLLING_INTERVAL", poll_seconds ) } )
        {
            if ( !result )
            {
                return result;
            }
        }
        config.poll_interval = std::chrono::seconds( poll_seconds );
        return outcome::success();
    }

    outcome::result<void> ConfigLoader::validate( const BridgeConfig            &config,
                                                  const crypto::Secp256k1Provider &provider ) const
    {
        for ( const auto *url : { &config.source.rpc_url, &config.destination.rpc_url } )
        {
            if ( url->find( "your_infura_id" ) != std::string::npos )
            {
                logger_->critical( "Please replace 'your_infura_id' in your environment or config file." );
                return ConfigError::PLACEHOLDER_VALUE;
            }
            if ( !api::parseUrl( *url ) )
            {
                logger_->critical( "RPC url {} is not an http(s) url", *url );
                return ConfigError::INVALID_VALUE;
            }
        }
        if ( config.validator_private_key.find( "your_private_key_here" ) != std::string::npos )
        {
            logger_->critical( "Please provide the validator private key." );
            return ConfigError::PLACEHOLDER_VALUE;
        }

        const std::pair<const char *, const std::string *> addresses[] = {
            { "source bridge contract", &config.source.contract },
            { "destination bridge contract", &config.destination.contract },
            { "validator address", &config.validator_address } };
        for ( const auto &[what, address] : addresses )
        {
            if ( isPlaceholderAddress( *address ) )
            {
                logger_->critical( "Please provide a valid {} instead of {}", what, *address );
                return ConfigError::PLACEHOLDER_VALUE;
            }
            if ( !eth::parseAddress( *address ) )
            {
                logger_->critical( "The {} {} is not a valid address", what, *address );
                return ConfigError::INVALID_ADDRESS;
            }
        }

        if ( config.source.chain_id == 0 || config.destination.chain_id == 0 )
        {
            logger_->critical( "Chain ids must be positive" );
            return ConfigError::INVALID_VALUE;
        }

        auto source_abi = eth::ContractAbi::parse( config.source.abi );
        if ( !source_abi )
        {
            logger_->critical( "Source ABI: {}", source_abi.error().message() );
            return ConfigError::INVALID_ABI;
        }
        const auto *event = source_abi.value().findEvent( config.event_name );
        if ( event == nullptr )
        {
            logger_->critical( "Source ABI has no event {}", config.event_name );
            return ConfigError::MISSING_EVENT;
        }
        for ( const char *argument : { "from", "to", "amount", "nonce" } )
        {
            bool found = std::any_of( event->inputs.begin(), event->inputs.end(),
                                      [argument]( const eth::AbiParam &param ) { return param.name == argument; } );
            if ( !found )
            {
                logger_->critical( "Event {} has no '{}' argument", config.event_name, argument );
                return ConfigError::MISSING_EVENT;
            }
        }

        auto destination_abi = eth::ContractAbi::parse( config.destination.abi );
        if ( !destination_abi )
        {
            logger_->critical( "Destination ABI: {}", destination_abi.error().message() );
            return ConfigError::INVALID_ABI;
        }
        const auto *mint = destination_abi.value().findFunction( config.mint_function );
        if ( mint == nullptr || mint->inputs.size() != 3 )
        {
            logger_->critical( "Destination ABI has no {}(address,uint256,uint256)", config.mint_function );
            return ConfigError::MISSING_FUNCTION;
        }
        const auto *processed = destination_abi.value().findFunction( config.processed_function );
        if ( processed == nullptr || processed->inputs.size() != 1 || processed->outputs.size() != 1 ||
             processed->outputs.front().type != "bool" )
        {
            logger_->critical( "Destination ABI has no {}(uint256) returning bool", config.processed_function );
            return ConfigError::MISSING_FUNCTION;
        }

        if ( config.poll_interval.count() <= 0 || config.reconnect_backoff.count() <= 0 ||
             config.max_reconnect_backoff.count() <= 0 || config.oracle_timeout.count() <= 0 ||
             config.rpc_timeout.count() <= 0 )
        {
            logger_->critical( "Poll interval, backoff and timeouts must be positive" );
            return ConfigError::NON_POSITIVE_INTERVAL;
        }
        if ( config.max_reconnect_backoff < config.reconnect_backoff || config.relay_retry_limit == 0 ||
             config.nonce_cache_capacity == 0 || config.gas_limit == 0 )
        {
            logger_->critical( "max_reconnect_backoff must not be below reconnect_backoff; retry limit, cache "
                               "capacity and gas limit must be positive" );
            return ConfigError::INVALID_VALUE;
        }

        auto key = crypto::SecretKey::fromHex( config.validator_private_key );
        if ( !key )
        {
            logger_->critical( "Validator private key is malformed: {}", key.error().message() );
            return ConfigError::INVALID_PRIVATE_KEY;
        }
        auto public_key = provider.derivePublicKey( key.value() );
        if ( !public_key )
        {
            logger_->critical( "Validator private key is not a valid secp256k1 scalar" );
            return ConfigError::INVALID_PRIVATE_KEY;
        }
        auto derived    = eth::addressFromPublicKey( public_key.value() );
        auto configured = eth::parseAddress( config.validator_address );
        if ( !configured || derived != configured.value() )
        {
            logger_->critical( "Validator private key belongs to {}, not to {}", eth::toChecksumAddress( derived ),
                               config.validator_address );
            return ConfigError::VALIDATOR_MISMATCH;
        }
        return outcome::success();
    }

    void ConfigLoader::wipeSecret( BridgeConfig &config )
    {
        if ( !config.validator_private_key.empty() )
        {
            OPENSSL_cleanse( config.validator_private_key.data(), config.validator_private_key.size() );
        }
        config.validator_private_key.clear();
    }
}
