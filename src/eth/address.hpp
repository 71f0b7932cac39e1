#ifndef CHAINRELAY_ETH_ADDRESS_HPP
#define CHAINRELAY_ETH_ADDRESS_HPP

#include <string>
#include <string_view>

#include "base/blob.hpp"
#include "crypto/secp256k1_types.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::eth {

  enum class AddressError {
    MISSING_0X_PREFIX = 1,
    INVALID_LENGTH,
    NON_HEX_INPUT,
    BAD_CHECKSUM
  };

  /// 20-byte account or contract address
  using Address = base::Blob<20>;

  /**
   * @brief Parses "0x" + 40 hex digits. All-lowercase and all-uppercase input
   * is accepted as is; mixed case must carry a valid EIP-55 checksum.
   */
  outcome::result<Address> parseAddress(std::string_view text);

  /**
   * @brief EIP-55 mixed-case rendering, e.g.
   * 0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed
   */
  std::string toChecksumAddress(const Address &address);

  /**
   * @brief Last 20 bytes of keccak256(X || Y)
   */
  Address addressFromPublicKey(
      const crypto::secp256k1::UncompressedPublicKey &public_key);

}  // namespace chainrelay::eth

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::eth, AddressError);

#endif  // CHAINRELAY_ETH_ADDRESS_HPP
