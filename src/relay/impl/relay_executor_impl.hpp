#ifndef CHAINRELAY_RELAY_IMPL_RELAY_EXECUTOR_IMPL_HPP
#define CHAINRELAY_RELAY_IMPL_RELAY_EXECUTOR_IMPL_HPP

#include <memory>

#include "base/logger.hpp"
#include "chain/chain_link.hpp"
#include "relay/recent_nonce_cache.hpp"
#include "relay/relay_executor.hpp"
#include "relay/validator_identity.hpp"

namespace chainrelay::relay {

  struct RelayConfig {
    eth::Address contract;
    eth::ContractAbi abi;
    std::string mint_function = "mint";
    std::string processed_function = "processedNonces";
    base::uint256_t gas_limit = 200000;
  };

  class RelayExecutorImpl : public RelayExecutor {
   public:
    RelayExecutorImpl(RelayConfig config,
                      std::shared_ptr<chain::ChainLink> destination,
                      std::shared_ptr<ValidatorIdentity> identity,
                      std::shared_ptr<RecentNonceCache> cache);

    ~RelayExecutorImpl() override = default;

    outcome::result<void> prepare() override;

    outcome::result<RelayReceipt> relay(
        const primitives::BridgeEvent &event) override;

   private:
    /// eth_call of the processed-nonce predicate
    outcome::result<bool> isProcessed(const base::uint256_t &nonce);

    outcome::result<std::vector<uint8_t>> buildSignedTransaction(
        const primitives::RelayRequest &request);

    outcome::result<base::Hash256> submit(
        const std::vector<uint8_t> &raw_transaction,
        const primitives::RelayRequest &request);

    RelayConfig config_;
    std::shared_ptr<chain::ChainLink> destination_;
    std::shared_ptr<ValidatorIdentity> identity_;
    std::shared_ptr<RecentNonceCache> cache_;
    std::shared_ptr<chain::ContractHandle> contract_;
    base::Logger logger_ = base::createLogger("RelayExecutor");
  };

}  // namespace chainrelay::relay

#endif  // CHAINRELAY_RELAY_IMPL_RELAY_EXECUTOR_IMPL_HPP
