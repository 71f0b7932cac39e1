#include "watcher/event_poller.hpp"

#include <algorithm>

namespace chainrelay::watcher {

    EventPoller::EventPoller(PollerConfig config,
                             std::shared_ptr<chain::ChainLink> source,
                             std::shared_ptr<chain::ChainLink> destination,
                             std::shared_ptr<validation::ValidationPipeline> pipeline,
                             std::shared_ptr<relay::RelayExecutor> executor,
                             std::shared_ptr<clock::Sleeper> sleeper,
                             std::shared_ptr<clock::SystemClock> clock)
        : config_(std::move(config)),
          source_(std::move(source)),
          destination_(std::move(destination)),
          pipeline_(std::move(pipeline)),
          executor_(std::move(executor)),
          sleeper_(std::move(sleeper)),
          clock_(std::move(clock)) {
    }

    EventPoller::~EventPoller() {
        stop();
    }

    outcome::result<void> EventPoller::setup() {
        logger_->info("Setting up listener components...");
        filter_.reset();
        source_contract_.reset();

        auto source_connected = source_->connect();
        if (!source_connected) {
            return source_connected;
        }
        auto destination_connected = destination_->connect();
        if (!destination_connected) {
            return destination_connected;
        }

        auto contract = source_->bindContract(config_.source_contract, config_.source_abi);
        if (!contract) {
            return contract.as_failure();
        }
        source_contract_ = contract.value();

        auto prepared = executor_->prepare();
        if (!prepared) {
            return prepared;
        }

        auto filter = source_contract_->createEventFilter(config_.event_name, resume_block_);
        if (!filter) {
            return filter.as_failure();
        }
        filter_ = filter.value();

        state_ = PollerState::Polling;
        logger_->info("Listening for '{}' events on contract {} from block {}",
                      config_.event_name,
                      eth::toChecksumAddress(config_.source_contract),
                      resume_block_ ? std::to_string(*resume_block_) : std::string("latest"));
        return outcome::success();
    }

    void EventPoller::start() {
        std::lock_guard<std::mutex> lock(running_mutex_);
        if (running_) return;

        running_ = true;
        stop_requested_ = false;
        sleeper_->reset();
        watcherThread_ = boost::thread(&EventPoller::run, this);
    }

    void EventPoller::stop() {
        {
            std::lock_guard<std::mutex> lock(running_mutex_);
            stop_requested_ = true;
            running_ = false;
        }
        sleeper_->interrupt();

        if (watcherThread_.joinable()) {
            watcherThread_.join();
        }
    }

    bool EventPoller::isRunning() const {
        std::lock_guard<std::mutex> const lock(running_mutex_);
        return running_;
    }

    void EventPoller::run() {
        while (step()) {
        }
        logger_->info("Event poller stopped");
    }

    bool EventPoller::step() {
        if (stop_requested_) {
            state_ = PollerState::Stopped;
            return false;
        }

        switch (state_.load()) {
            case PollerState::Idle: {
                auto ready = setup();
                if (!ready) {
                    enterReconnecting(ready.error().message());
                }
                break;
            }
            case PollerState::Polling:
                poll();
                break;
            case PollerState::Reconnecting:
                reconnect();
                break;
            case PollerState::Stopped:
                return false;
        }
        return state_ != PollerState::Stopped;
    }

    void EventPoller::poll() {
        if (!drainPending()) {
            enterReconnecting("destination chain unavailable");
            return;
        }

        int64_t head = source_->latestBlock();
        auto entries = filter_->getNewEntries();
        if (!entries) {
            enterReconnecting(entries.error().message());
            return;
        }
        reconnect_state_.recordSuccess(clock_->now());
        if (head >= 0) {
            resume_block_ = std::max(resume_block_.value_or(0), static_cast<uint64_t>(head));
        }

        auto &logs = entries.value();
        if (logs.empty()) {
            logger_->debug("No new events found. Polling again in {} ms", config_.poll_interval.count());
        } else {
            logger_->info("Found {} new event(s)!", logs.size());
        }

        for (size_t i = 0; i < logs.size(); ++i) {
            PendingRelay item{primitives::BridgeEvent::fromLog(logs[i], source_->chainId())};
            resume_block_ = std::max(resume_block_.value_or(0), item.event.block_number);
            logger_->info("Processing event from transaction: {}", item.event.source_tx_hash.toHexWithPrefix());

            if (pending_.contains(item.event)) {
                logger_->info("Nonce {} is already waiting for retry", item.event.nonceText());
                continue;
            }

            auto result = dispatch(item);
            if (result == DispatchResult::RetryLater) {
                pending_.push(std::move(item));
            } else if (result == DispatchResult::Disconnected) {
                pending_.push(std::move(item));
                for (size_t j = i + 1; j < logs.size(); ++j) {
                    pending_.push(PendingRelay{primitives::BridgeEvent::fromLog(logs[j], source_->chainId())});
                }
                enterReconnecting("destination chain unavailable");
                return;
            }
        }

        sleeper_->sleepFor(config_.poll_interval);
    }

    bool EventPoller::drainPending() {
        if (pending_.empty()) {
            return true;
        }
        logger_->info("Retrying {} pending event(s)", pending_.size());

        auto items = pending_.takeAll();
        while (!items.empty()) {
            auto item = std::move(items.front());
            items.pop_front();

            auto result = dispatch(item);
            if (result == DispatchResult::RetryLater) {
                pending_.push(std::move(item));
            } else if (result == DispatchResult::Disconnected) {
                pending_.push(std::move(item));
                for (auto &rest : items) {
                    pending_.push(std::move(rest));
                }
                return false;
            }
        }
        return true;
    }

    EventPoller::DispatchResult EventPoller::dispatch(PendingRelay &item) {
        if (!item.validated) {
            auto verdict = pipeline_->validate(item.event);
            if (!verdict.passed) {
                if (verdict.reason == std::string(validation::reasons::kMalformedEvent)) {
                    logger_->warn("MalformedEvent: discarding event from transaction {}",
                                  item.event.source_tx_hash.toHexWithPrefix());
                } else {
                    logger_->warn("Transaction validation failed for nonce {}. Skipping.", item.event.nonceText());
                }
                return DispatchResult::Finished;
            }
            item.validated = true;
        }

        auto relayed = executor_->relay(item.event);
        if (relayed) {
            return DispatchResult::Finished;
        }

        const auto &error = relayed.error();
        if (relay::isConnectivityError(error)) {
            return DispatchResult::Disconnected;
        }
        if (relay::isSubmissionError(error)) {
            ++item.submission_failures;
            if (item.submission_failures >= config_.relay_retry_limit) {
                logger_->critical("DROPPED BRIDGE ACTION: escalate, nonce {} given up after {} failed submission(s): {}",
                                  item.event.nonceText(),
                                  item.submission_failures,
                                  error.message());
                return DispatchResult::Finished;
            }
            logger_->error("Nonce {} will be retried ({}/{}): {}",
                           item.event.nonceText(),
                           item.submission_failures,
                           config_.relay_retry_limit,
                           error.message());
            return DispatchResult::RetryLater;
        }

        logger_->error("Nonce {} cannot be relayed: {}", item.event.nonceText(), error.message());
        return DispatchResult::Finished;
    }

    void EventPoller::enterReconnecting(const std::string &reason) {
        reconnect_state_.recordFailure();
        filter_.reset();
        state_ = PollerState::Reconnecting;
        logger_->error("Error in listening loop: {}. Reconnecting and retrying... (failure {})",
                       reason,
                       reconnect_state_.consecutive_failures);
    }

    void EventPoller::reconnect() {
        auto delay = backoffFor(reconnect_state_.consecutive_failures);
        logger_->info("Reconnect attempt in {} ms", delay.count());
        if (!sleeper_->sleepFor(delay)) {
            return;
        }

        auto ready = setup();
        if (!ready) {
            reconnect_state_.recordFailure();
            logger_->error("Reconnect attempt {} failed: {}",
                           reconnect_state_.consecutive_failures,
                           ready.error().message());
        }
    }

    std::chrono::milliseconds EventPoller::backoffFor(uint32_t attempt) const {
        auto delay = config_.reconnect_backoff;
        for (uint32_t i = 1; i < attempt && delay < config_.max_reconnect_backoff; ++i) {
            delay *= 2;
        }
        return std::min(delay, std::max(config_.reconnect_backoff, config_.max_reconnect_backoff));
    }

}  // namespace chainrelay::watcher
