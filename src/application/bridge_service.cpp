#include "application/bridge_service.hpp"

#include "application/impl/config_reader/error.hpp"
#include "chain/impl/evm_chain_link.hpp"
#include "coinprices/coinprices.hpp"
#include "relay/impl/relay_executor_impl.hpp"
#include "relay/recent_nonce_cache.hpp"
#include "relay/validator_identity.hpp"
#include "validation/rules/completeness_rule.hpp"
#include "validation/rules/market_price_rule.hpp"
#include "validation/rules/minimum_amount_rule.hpp"

namespace chainrelay::application
{
    outcome::result<std::shared_ptr<BridgeService>> BridgeService::create(
        const BridgeConfig &config, std::shared_ptr<api::HttpClient> http,
        std::shared_ptr<crypto::Secp256k1Provider> provider, std::shared_ptr<clock::Sleeper> sleeper,
        std::shared_ptr<clock::SystemClock> clock )
    {
        auto source_contract = eth::parseAddress( config.source.contract );
        auto dest_contract   = eth::parseAddress( config.destination.contract );
        if ( !source_contract || !dest_contract )
        {
            return ConfigError::INVALID_ADDRESS;
        }
        auto source_abi = eth::ContractAbi::parse( config.source.abi );
        auto dest_abi   = eth::ContractAbi::parse( config.destination.abi );
        if ( !source_abi || !dest_abi )
        {
            return ConfigError::INVALID_ABI;
        }
        auto key = crypto::SecretKey::fromHex( config.validator_private_key );
        if ( !key )
        {
            return ConfigError::INVALID_PRIVATE_KEY;
        }
        auto identity = relay::ValidatorIdentity::create( std::move( key.value() ), std::move( provider ) );
        if ( !identity )
        {
            return ConfigError::INVALID_PRIVATE_KEY;
        }

        Components components;
        components.source      = std::make_shared<chain::EvmChainLink>( http, config.source.rpc_url,
                                                                        config.source.chain_id, config.rpc_timeout );
        components.destination = std::make_shared<chain::EvmChainLink>(
            http, config.destination.rpc_url, config.destination.chain_id, config.rpc_timeout );

        auto oracle = std::make_shared<coinprices::CoinGeckoPriceRetriever>( http, config.oracle_timeout,
                                                                             config.price_feed_url );
        components.pipeline = std::make_shared<validation::ValidationPipeline>(
            std::vector<std::shared_ptr<validation::ValidationRule>>{
                std::make_shared<validation::CompletenessRule>(),
                std::make_shared<validation::MinimumAmountRule>( config.minimum_amount ),
                std::make_shared<validation::MarketPriceRule>( oracle, config.price_asset, config.price_floor_usd ) } );

        relay::RelayConfig relay_config;
        relay_config.contract           = dest_contract.value();
        relay_config.abi                = std::move( dest_abi.value() );
        relay_config.mint_function      = config.mint_function;
        relay_config.processed_function = config.processed_function;
        relay_config.gas_limit          = config.gas_limit;
        components.executor = std::make_shared<relay::RelayExecutorImpl>(
            std::move( relay_config ), components.destination, identity.value(),
            std::make_shared<relay::RecentNonceCache>( config.nonce_cache_capacity ) );

        components.sleeper = std::move( sleeper );
        components.clock   = std::move( clock );

        watcher::PollerConfig poller_config;
        poller_config.source_contract       = source_contract.value();
        poller_config.source_abi            = std::move( source_abi.value() );
        poller_config.event_name            = config.event_name;
        poller_config.poll_interval         = config.poll_interval;
        poller_config.reconnect_backoff     = config.reconnect_backoff;
        poller_config.max_reconnect_backoff = config.max_reconnect_backoff;
        poller_config.relay_retry_limit     = config.relay_retry_limit;

        auto service = std::make_shared<BridgeService>( std::move( poller_config ), std::move( components ) );
        service->logger_->info( "Validator address: {}", eth::toChecksumAddress( identity.value()->address() ) );
        return service;
    }

    BridgeService::BridgeService( watcher::PollerConfig config, Components components )
    {
        poller_ = std::make_shared<watcher::EventPoller>( std::move( config ), std::move( components.source ),
                                                          std::move( components.destination ),
                                                          std::move( components.pipeline ),
                                                          std::move( components.executor ),
                                                          std::move( components.sleeper ), std::move( components.clock ) );
    }

    BridgeService::~BridgeService()
    {
        stop();
    }

    outcome::result<void> BridgeService::start()
    {
        {
            std::lock_guard<std::mutex> lock( stop_mutex_ );
            if ( stop_requested_ )
            {
                logger_->info( "Shutdown requested before start, not polling" );
                return outcome::success();
            }
        }

        logger_->info( "Starting cross-chain bridge relay" );
        auto setup = poller_->setup();
        if ( !setup )
        {
            logger_->critical( "Failed to establish initial blockchain connection: {}. Please check your RPC URLs "
                               "and network.",
                               setup.error().message() );
            return setup.as_failure();
        }

        std::lock_guard<std::mutex> lock( stop_mutex_ );
        if ( stop_requested_ )
        {
            logger_->info( "Shutdown requested during setup, not polling" );
            return outcome::success();
        }
        poller_->start();
        return outcome::success();
    }

    void BridgeService::stop()
    {
        {
            std::lock_guard<std::mutex> lock( stop_mutex_ );
            stop_requested_ = true;
        }
        if ( poller_->isRunning() )
        {
            logger_->info( "Shutdown signal received. Exiting gracefully." );
        }
        poller_->stop();
    }

    bool BridgeService::isRunning() const
    {
        return poller_->isRunning();
    }
}
