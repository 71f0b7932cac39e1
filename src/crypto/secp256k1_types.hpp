#ifndef CHAINRELAY_CRYPTO_SECP256K1_TYPES_HPP
#define CHAINRELAY_CRYPTO_SECP256K1_TYPES_HPP

#include "base/blob.hpp"

namespace chainrelay::crypto::secp256k1 {
  namespace constants {
    static constexpr size_t kUncompressedPublicKeySize = 65u;
    static constexpr size_t kPrivateKeySize = 32u;
    static constexpr size_t kScalarSize = 32u;
  }  // namespace constants

  /**
   * uncompressed form of public key, 0x04 || X || Y
   */
  using UncompressedPublicKey =
      base::Blob<constants::kUncompressedPublicKeySize>;

  /**
   * 32-byte sequence of bytes (keccak256 of the signed payload)
   */
  using MessageHash = base::Hash256;

  /**
   * secp256k1 signature with the recovery id needed to rebuild the public key;
   * s is always normalized to the lower half of the curve order
   */
  struct RecoverableSignature {
    base::Blob<constants::kScalarSize> r;
    base::Blob<constants::kScalarSize> s;
    uint8_t recovery_id = 0;

    bool operator==(const RecoverableSignature &other) const {
      return r == other.r && s == other.s && recovery_id == other.recovery_id;
    }
  };
}  // namespace chainrelay::crypto::secp256k1

#endif  // CHAINRELAY_CRYPTO_SECP256K1_TYPES_HPP
