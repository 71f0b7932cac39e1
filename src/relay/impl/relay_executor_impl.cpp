#include "relay/impl/relay_executor_impl.hpp"

#include "eth/transaction.hpp"

namespace chainrelay::relay {

  RelayExecutorImpl::RelayExecutorImpl(
      RelayConfig config,
      std::shared_ptr<chain::ChainLink> destination,
      std::shared_ptr<ValidatorIdentity> identity,
      std::shared_ptr<RecentNonceCache> cache)
      : config_(std::move(config)),
        destination_(std::move(destination)),
        identity_(std::move(identity)),
        cache_(std::move(cache)) {}

  outcome::result<void> RelayExecutorImpl::prepare() {
    auto handle = destination_->bindContract(config_.contract, config_.abi);
    if (!handle) {
      logger_->error("Cannot bind destination contract {}: {}",
                     eth::toChecksumAddress(config_.contract),
                     handle.error().message());
      return handle.as_failure();
    }
    contract_ = std::move(handle.value());
    return outcome::success();
  }

  outcome::result<RelayReceipt> RelayExecutorImpl::relay(
      const primitives::BridgeEvent &event) {
    if (!event.to || !event.amount || !event.nonce) {
      return RelayError::INCOMPLETE_EVENT;
    }
    RelayReceipt receipt;
    receipt.request =
        primitives::RelayRequest{*event.to, *event.amount, *event.nonce};
    const auto &request = receipt.request;
    auto nonce = base::toDecimal(request.source_nonce);

    if (!contract_ || !destination_->isConnected()) {
      logger_->error(
          "DestinationUnavailable: chain {} is not connected, nonce {} kept "
          "for retry",
          destination_->chainId(),
          nonce);
      return RelayError::DESTINATION_UNAVAILABLE;
    }

    if (auto tx_hash = cache_->find(request.source_nonce)) {
      logger_->info("Nonce {} already submitted by this relayer in {}",
                    nonce,
                    tx_hash->toHexWithPrefix());
      receipt.status = RelayStatus::RECENTLY_SUBMITTED;
      receipt.tx_hash = *tx_hash;
      return receipt;
    }

    auto processed = isProcessed(request.source_nonce);
    if (!processed) {
      return processed.as_failure();
    }
    if (processed.value()) {
      logger_->info("Nonce {} already processed on chain {}, skipping",
                    nonce,
                    destination_->chainId());
      receipt.status = RelayStatus::ALREADY_PROCESSED;
      return receipt;
    }

    logger_->info("Minting {} for {} on chain {} (source nonce {})",
                  base::toDecimal(request.amount),
                  eth::toChecksumAddress(request.recipient),
                  destination_->chainId(),
                  nonce);

    auto raw = buildSignedTransaction(request);
    if (!raw) {
      logger_->error("SubmissionError: no transaction for nonce {}: {}",
                     nonce,
                     raw.error().message());
      return raw.as_failure();
    }

    auto tx_hash = submit(raw.value(), request);
    if (!tx_hash) {
      return tx_hash.as_failure();
    }
    cache_->insert(request.source_nonce, tx_hash.value());
    logger_->info("Transaction sent to chain {} for nonce {}: {}",
                  destination_->chainId(),
                  nonce,
                  tx_hash.value().toHexWithPrefix());
    receipt.status = RelayStatus::SUBMITTED;
    receipt.tx_hash = tx_hash.value();
    return receipt;
  }

  outcome::result<bool> RelayExecutorImpl::isProcessed(
      const base::uint256_t &nonce) {
    auto result = contract_->call(config_.processed_function, {nonce});
    if (!result) {
      logger_->error("Processed-nonce check for {} failed: {}",
                     base::toDecimal(nonce),
                     result.error().message());
      return RelayError::REPLAY_CHECK_FAILED;
    }
    if (result.value().empty()) {
      return RelayError::REPLAY_CHECK_FAILED;
    }
    const auto *flag = std::get_if<bool>(&result.value().front());
    if (flag == nullptr) {
      logger_->error("{} did not return a bool", config_.processed_function);
      return RelayError::REPLAY_CHECK_FAILED;
    }
    return *flag;
  }

  outcome::result<std::vector<uint8_t>>
  RelayExecutorImpl::buildSignedTransaction(
      const primitives::RelayRequest &request) {
    auto calldata = contract_->encodeCall(
        config_.mint_function,
        {request.recipient, request.amount, request.source_nonce});
    if (!calldata) {
      logger_->error("Cannot encode {}: {}",
                     config_.mint_function,
                     calldata.error().message());
      return RelayError::TRANSACTION_BUILD_FAILED;
    }

    // sampled right before submission
    auto gas_price = destination_->gasPrice();
    if (!gas_price) {
      logger_->error("eth_gasPrice failed: {}", gas_price.error().message());
      return RelayError::TRANSACTION_BUILD_FAILED;
    }
    auto account_nonce = destination_->transactionCount(identity_->address());
    if (!account_nonce) {
      logger_->error("eth_getTransactionCount failed: {}",
                     account_nonce.error().message());
      return RelayError::TRANSACTION_BUILD_FAILED;
    }

    eth::LegacyTransaction tx;
    tx.nonce = account_nonce.value();
    tx.gas_price = gas_price.value();
    tx.gas_limit = config_.gas_limit;
    tx.to = contract_->address();
    tx.value = 0;
    tx.data = std::move(calldata.value());
    tx.chain_id = destination_->chainId();

    auto signature = identity_->sign(tx.signingHash());
    if (!signature) {
      logger_->error("Signing failed: {}", signature.error().message());
      return RelayError::SIGNING_FAILED;
    }
    return tx.encodeSigned(signature.value());
  }

  outcome::result<base::Hash256> RelayExecutorImpl::submit(
      const std::vector<uint8_t> &raw_transaction,
      const primitives::RelayRequest &request) {
    auto sent = destination_->sendRawTransaction(raw_transaction);
    if (sent) {
      return sent.value();
    }

    if (sent.error() == chain::ChainLinkError::NOT_CONNECTED
        || sent.error() == chain::ChainLinkError::CALL_FAILED) {
      logger_->error("Submission of nonce {} did not reach chain {}: {}",
                     base::toDecimal(request.source_nonce),
                     destination_->chainId(),
                     sent.error().message());
      return RelayError::DESTINATION_UNAVAILABLE;
    }

    RelayError error = RelayError::SUBMISSION_REJECTED;
    if (sent.error() == chain::ChainLinkError::NONCE_TOO_LOW) {
      error = RelayError::SUBMISSION_NONCE_TOO_LOW;
    } else if (sent.error() == chain::ChainLinkError::INSUFFICIENT_FUNDS) {
      error = RelayError::SUBMISSION_INSUFFICIENT_FUNDS;
    }

    logger_->error(
        "SubmissionError for nonce {} (recipient {}, amount {}): {}; node "
        "said: {}",
        base::toDecimal(request.source_nonce),
        eth::toChecksumAddress(request.recipient),
        base::toDecimal(request.amount),
        make_error_code(error).message(),
        destination_->lastNodeError().value_or(sent.error().message()));
    return error;
  }

}  // namespace chainrelay::relay
