#ifndef CHAINRELAY_WATCHER_EVENT_POLLER_HPP
#define CHAINRELAY_WATCHER_EVENT_POLLER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/thread.hpp>

#include "base/logger.hpp"
#include "chain/chain_link.hpp"
#include "clock/clock.hpp"
#include "clock/sleeper.hpp"
#include "relay/relay_executor.hpp"
#include "validation/validation_pipeline.hpp"
#include "watcher/pending_relay_queue.hpp"
#include "watcher/reconnect_state.hpp"

namespace chainrelay::watcher {

    enum class PollerState { Idle, Polling, Reconnecting, Stopped };

    struct PollerConfig
    {
        eth::Address              source_contract;
        eth::ContractAbi          source_abi;
        std::string               event_name            = "TokensLocked";
        std::chrono::milliseconds poll_interval         = std::chrono::seconds(12);
        std::chrono::milliseconds reconnect_backoff     = std::chrono::seconds(15);
        std::chrono::milliseconds max_reconnect_backoff = std::chrono::seconds(15);
        uint32_t                  relay_retry_limit     = 3;
    };

    /**
     * @brief Orchestrating loop of one bridge direction. Owns the source log
     * filter, sends every entry through validation and relay in log order, and
     * reconnects with backoff whenever a chain fails. Runs on its own thread;
     * stop() is honoured between cycles so an event being relayed is always
     * finished.
     */
    class EventPoller
    {
    public:
        EventPoller(PollerConfig config,
                    std::shared_ptr<chain::ChainLink> source,
                    std::shared_ptr<chain::ChainLink> destination,
                    std::shared_ptr<validation::ValidationPipeline> pipeline,
                    std::shared_ptr<relay::RelayExecutor> executor,
                    std::shared_ptr<clock::Sleeper> sleeper,
                    std::shared_ptr<clock::SystemClock> clock);

        ~EventPoller();

        /**
         * @brief Connects both chains, binds both contracts and installs the
         * filter. Moves Idle or Reconnecting to Polling on success.
         */
        outcome::result<void> setup();

        /// Runs the loop on a dedicated thread
        void start();

        /// Requests shutdown and joins the thread
        void stop();

        bool isRunning() const;

        /**
         * @brief Blocking loop, returns once stopped
         */
        void run();

        /**
         * @brief Executes one transition of the state machine
         * @return false once the poller is Stopped
         */
        bool step();

        PollerState state() const {
            return state_;
        }

        const ReconnectState &reconnectState() const {
            return reconnect_state_;
        }

        /// First block the next filter will include
        std::optional<uint64_t> resumeBlock() const {
            return resume_block_;
        }

        size_t pendingCount() const {
            return pending_.size();
        }

        /// Delay before the given reconnect attempt, doubling up to the ceiling
        std::chrono::milliseconds backoffFor(uint32_t attempt) const;

    private:
        enum class DispatchResult { Finished, RetryLater, Disconnected };

        void poll();
        void reconnect();
        void enterReconnecting(const std::string &reason);
        bool drainPending();
        DispatchResult dispatch(PendingRelay &item);

        PollerConfig                                    config_;
        std::shared_ptr<chain::ChainLink>               source_;
        std::shared_ptr<chain::ChainLink>               destination_;
        std::shared_ptr<validation::ValidationPipeline> pipeline_;
        std::shared_ptr<relay::RelayExecutor>           executor_;
        std::shared_ptr<clock::Sleeper>                 sleeper_;
        std::shared_ptr<clock::SystemClock>             clock_;

        std::shared_ptr<chain::ContractHandle> source_contract_;
        std::shared_ptr<chain::LogFilter>      filter_;
        std::atomic<PollerState>               state_{PollerState::Idle};
        std::atomic<bool>                      stop_requested_{false};
        ReconnectState                         reconnect_state_;
        std::optional<uint64_t>                resume_block_;
        PendingRelayQueue                      pending_;

        bool               running_ = false;
        mutable std::mutex running_mutex_;
        boost::thread      watcherThread_;

        base::Logger logger_ = base::createLogger("EventPoller");
    };

}  // namespace chainrelay::watcher

#endif // CHAINRELAY_WATCHER_EVENT_POLLER_HPP
