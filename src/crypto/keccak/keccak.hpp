#ifndef CHAINRELAY_CRYPTO_KECCAK_HPP
#define CHAINRELAY_CRYPTO_KECCAK_HPP

#include <string_view>

#include <gsl/span>
#include "base/blob.hpp"

namespace chainrelay::crypto {
  /**
   * Take a Keccak-256 hash from string. This is the pre-standard padding
   * used by Ethereum, not FIPS-202 SHA3-256.
   * @param input to be hashed
   * @return hashed bytes
   */
  base::Hash256 keccak256(std::string_view input);

  /**
   * Take a Keccak-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  base::Hash256 keccak256(gsl::span<const uint8_t> input);
}  // namespace chainrelay::crypto

#endif  // CHAINRELAY_CRYPTO_KECCAK_HPP
