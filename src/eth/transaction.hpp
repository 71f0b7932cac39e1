#ifndef CHAINRELAY_ETH_TRANSACTION_HPP
#define CHAINRELAY_ETH_TRANSACTION_HPP

#include <vector>

#include "base/uint256.hpp"
#include "crypto/secp256k1_types.hpp"
#include "eth/address.hpp"

namespace chainrelay::eth {

  /**
   * Pre-EIP-2718 transaction, replay protected by EIP-155
   */
  struct LegacyTransaction {
    base::uint256_t nonce;
    base::uint256_t gas_price;
    base::uint256_t gas_limit;
    Address to;
    base::uint256_t value;
    std::vector<uint8_t> data;
    uint64_t chain_id = 0;

    /**
     * @brief keccak256(rlp([nonce, gasPrice, gas, to, value, data, chainId,
     * 0, 0]))
     */
    [[nodiscard]] base::Hash256 signingHash() const;

    /**
     * @brief rlp([nonce, gasPrice, gas, to, value, data, v, r, s]) with
     * v = recovery_id + 35 + 2 * chainId
     */
    [[nodiscard]] std::vector<uint8_t> encodeSigned(
        const crypto::secp256k1::RecoverableSignature &signature) const;
  };

  /// Hash under which a node reports a submitted raw transaction
  base::Hash256 transactionHash(const std::vector<uint8_t> &raw_transaction);

}  // namespace chainrelay::eth

#endif  // CHAINRELAY_ETH_TRANSACTION_HPP
