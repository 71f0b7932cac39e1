#ifndef CHAINRELAY_CHAIN_CONTRACT_HANDLE_HPP
#define CHAINRELAY_CHAIN_CONTRACT_HANDLE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chain/log_filter.hpp"
#include "eth/abi.hpp"
#include "eth/address.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::chain {

  /**
   * Contract bound to a connected chain
   */
  class ContractHandle {
   public:
    virtual ~ContractHandle() = default;

    virtual const eth::Address &address() const = 0;

    virtual const eth::ContractAbi &abi() const = 0;

    /**
     * @brief Read-only call against the latest block
     * @return decoded outputs of the function
     */
    virtual outcome::result<std::vector<eth::AbiValue>> call(
        const std::string &function, const std::vector<eth::AbiValue> &args) = 0;

    /**
     * @brief Calldata for a state changing call, to be put in a transaction
     */
    virtual outcome::result<std::vector<uint8_t>> encodeCall(
        const std::string &function,
        const std::vector<eth::AbiValue> &args) const = 0;

    /**
     * @brief Installs a filter on one event of this contract
     * @param event event name from the ABI
     * @param from_block first block to include, the chain head when empty
     */
    virtual outcome::result<std::shared_ptr<LogFilter>> createEventFilter(
        const std::string &event, std::optional<uint64_t> from_block) = 0;
  };

}  // namespace chainrelay::chain

#endif  // CHAINRELAY_CHAIN_CONTRACT_HANDLE_HPP
