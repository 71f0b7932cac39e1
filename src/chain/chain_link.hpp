#ifndef CHAINRELAY_CHAIN_CHAIN_LINK_HPP
#define CHAINRELAY_CHAIN_CHAIN_LINK_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "base/uint256.hpp"
#include "chain/contract_handle.hpp"
#include "chain/error.hpp"
#include "eth/abi.hpp"
#include "eth/address.hpp"

namespace chainrelay::chain {

  /**
   * @brief Handle to one chain node. Holds connection health and gives access
   * to contracts; carries no business logic and never retries on its own.
   */
  class ChainLink {
   public:
    virtual ~ChainLink() = default;

    /**
     * @brief (Re)establishes the rpc session in place. The block header
     * reader tolerant to proof-of-authority extra data is used for every
     * header query, starting with the one made here.
     * @return ChainLinkError::CONNECTION_FAILED or CHAIN_ID_MISMATCH; the
     * root cause is logged
     */
    virtual outcome::result<void> connect() = 0;

    /**
     * @brief Cached session state confirmed by a liveness check
     */
    virtual bool isConnected() = 0;

    /**
     * @brief Chain head, or -1 when not connected
     */
    virtual int64_t latestBlock() = 0;

    /**
     * @return ChainLinkError::NOT_CONNECTED when there is no session
     */
    virtual outcome::result<std::shared_ptr<ContractHandle>> bindContract(
        const eth::Address &address, const eth::ContractAbi &abi) = 0;

    /// Configured chain id, verified against the node on connect()
    virtual uint64_t chainId() const = 0;

    virtual outcome::result<base::uint256_t> gasPrice() = 0;

    /**
     * @brief Transaction count of an account including pending transactions
     */
    virtual outcome::result<base::uint256_t> transactionCount(
        const eth::Address &account) = 0;

    /**
     * @return hash of the accepted transaction; NONCE_TOO_LOW,
     * INSUFFICIENT_FUNDS or TRANSACTION_REJECTED when the node refused it,
     * CALL_FAILED when the request did not reach the node
     */
    virtual outcome::result<base::Hash256> sendRawTransaction(
        const std::vector<uint8_t> &raw_transaction) = 0;

    /// Error text of the node's last rejected request
    virtual std::optional<std::string> lastNodeError() const = 0;
  };

}  // namespace chainrelay::chain

#endif  // CHAINRELAY_CHAIN_CHAIN_LINK_HPP
