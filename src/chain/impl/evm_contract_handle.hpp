#ifndef CHAINRELAY_CHAIN_IMPL_EVM_CONTRACT_HANDLE_HPP
#define CHAINRELAY_CHAIN_IMPL_EVM_CONTRACT_HANDLE_HPP

#include "api/jrpc/json_rpc_client.hpp"
#include "base/logger.hpp"
#include "chain/contract_handle.hpp"

namespace chainrelay::chain {

  class EvmContractHandle : public ContractHandle {
   public:
    EvmContractHandle(std::shared_ptr<api::JsonRpcClient> client,
                      eth::Address address,
                      eth::ContractAbi abi,
                      base::Logger logger);

    const eth::Address &address() const override {
      return address_;
    }

    const eth::ContractAbi &abi() const override {
      return abi_;
    }

    outcome::result<std::vector<eth::AbiValue>> call(
        const std::string &function,
        const std::vector<eth::AbiValue> &args) override;

    outcome::result<std::vector<uint8_t>> encodeCall(
        const std::string &function,
        const std::vector<eth::AbiValue> &args) const override;

    outcome::result<std::shared_ptr<LogFilter>> createEventFilter(
        const std::string &event, std::optional<uint64_t> from_block) override;

   private:
    std::shared_ptr<api::JsonRpcClient> client_;
    eth::Address address_;
    eth::ContractAbi abi_;
    base::Logger logger_;
  };

}  // namespace chainrelay::chain

#endif  // CHAINRELAY_CHAIN_IMPL_EVM_CONTRACT_HANDLE_HPP
