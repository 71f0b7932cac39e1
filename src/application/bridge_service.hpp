#ifndef CHAINRELAY_APPLICATION_BRIDGE_SERVICE_HPP
#define CHAINRELAY_APPLICATION_BRIDGE_SERVICE_HPP

#include <memory>
#include <mutex>

#include "api/transport/http_client.hpp"
#include "application/bridge_config.hpp"
#include "base/logger.hpp"
#include "clock/clock.hpp"
#include "clock/sleeper.hpp"
#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "watcher/event_poller.hpp"

namespace chainrelay::application
{
    /**
     * @brief One bridge direction, wired from a validated BridgeConfig:
     * two chain links, the validation pipeline, the relay executor and the
     * poller driving them.
     */
    class BridgeService
    {
    public:
        struct Components
        {
            std::shared_ptr<chain::ChainLink>               source;
            std::shared_ptr<chain::ChainLink>               destination;
            std::shared_ptr<validation::ValidationPipeline> pipeline;
            std::shared_ptr<relay::RelayExecutor>           executor;
            std::shared_ptr<clock::Sleeper>                 sleeper;
            std::shared_ptr<clock::SystemClock>             clock;
        };

        /**
         * @brief Builds the production components. The private key is parsed
         * here and only survives inside the validator identity.
         */
        static outcome::result<std::shared_ptr<BridgeService>> create( const BridgeConfig                         &config,
                                                                       std::shared_ptr<api::HttpClient>            http,
                                                                       std::shared_ptr<crypto::Secp256k1Provider> provider,
                                                                       std::shared_ptr<clock::Sleeper>            sleeper,
                                                                       std::shared_ptr<clock::SystemClock>        clock );

        BridgeService( watcher::PollerConfig config, Components components );

        ~BridgeService();

        /**
         * @brief Performs the initial setup and starts polling. Nothing is
         * started once stop() was called, also when it was called while the
         * setup was still running.
         * @return the setup failure, in which case nothing runs
         */
        outcome::result<void> start();

        /// May be called from another thread, e.g. a signal handler
        void stop();

        bool isRunning() const;

        const watcher::EventPoller &poller() const
        {
            return *poller_;
        }

    private:
        std::shared_ptr<watcher::EventPoller> poller_;
        std::mutex                            stop_mutex_;
        bool                                  stop_requested_ = false;
        base::Logger                          logger_ = base::createLogger( "BridgeService" );
    };
}

#endif // CHAINRELAY_APPLICATION_BRIDGE_SERVICE_HPP
