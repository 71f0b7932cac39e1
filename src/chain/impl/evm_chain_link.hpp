#ifndef CHAINRELAY_CHAIN_IMPL_EVM_CHAIN_LINK_HPP
#define CHAINRELAY_CHAIN_IMPL_EVM_CHAIN_LINK_HPP

#include <chrono>

#include "api/jrpc/json_rpc_client.hpp"
#include "api/transport/http_client.hpp"
#include "base/logger.hpp"
#include "chain/chain_link.hpp"

namespace chainrelay::chain {

  /**
   * ChainLink to an EVM node over HTTP json-rpc
   */
  class EvmChainLink : public ChainLink {
   public:
    EvmChainLink(std::shared_ptr<api::HttpClient> http,
                 std::string rpc_url,
                 uint64_t chain_id,
                 std::chrono::milliseconds rpc_timeout);

    ~EvmChainLink() override = default;

    outcome::result<void> connect() override;

    bool isConnected() override;

    int64_t latestBlock() override;

    outcome::result<std::shared_ptr<ContractHandle>> bindContract(
        const eth::Address &address, const eth::ContractAbi &abi) override;

    uint64_t chainId() const override {
      return chain_id_;
    }

    outcome::result<base::uint256_t> gasPrice() override;

    outcome::result<base::uint256_t> transactionCount(
        const eth::Address &account) override;

    outcome::result<base::Hash256> sendRawTransaction(
        const std::vector<uint8_t> &raw_transaction) override;

    std::optional<std::string> lastNodeError() const override;

   private:
    outcome::result<void> establishSession();

    std::shared_ptr<api::HttpClient> http_;
    std::string rpc_url_;
    uint64_t chain_id_;
    std::chrono::milliseconds rpc_timeout_;
    std::shared_ptr<api::JsonRpcClient> client_;
    bool connected_ = false;
    base::Logger logger_;
  };

}  // namespace chainrelay::chain

#endif  // CHAINRELAY_CHAIN_IMPL_EVM_CHAIN_LINK_HPP
