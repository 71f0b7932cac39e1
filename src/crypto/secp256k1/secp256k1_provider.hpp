#ifndef CHAINRELAY_CRYPTO_SECP256K1_PROVIDER_HPP
#define CHAINRELAY_CRYPTO_SECP256K1_PROVIDER_HPP

#include "crypto/secp256k1_types.hpp"
#include "crypto/secret_key.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::crypto {

  enum class Secp256k1ProviderError {
    INVALID_PRIVATE_KEY = 1,
    INVALID_SIGNATURE,
    SIGNING_FAILED,
    RECOVERY_FAILED,
    INTERNAL_ERROR
  };

  /**
   * ECDSA over secp256k1 as used by Ethereum accounts
   */
  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief Computes the public key belonging to a private key
     * @param key private scalar, must be in [1, n)
     * @return uncompressed public key
     */
    virtual outcome::result<secp256k1::UncompressedPublicKey> derivePublicKey(
        const SecretKey &key) const = 0;

    /**
     * @brief Signs a 32-byte digest
     * @param hash digest to sign, already keccak-hashed by the caller
     * @param key private key
     * @return low-s signature with recovery id
     */
    virtual outcome::result<secp256k1::RecoverableSignature> sign(
        const secp256k1::MessageHash &hash, const SecretKey &key) const = 0;

    /**
     * @brief Rebuilds the signer's public key from a digest and signature
     */
    virtual outcome::result<secp256k1::UncompressedPublicKey> recoverPublicKey(
        const secp256k1::MessageHash &hash,
        const secp256k1::RecoverableSignature &signature) const = 0;
  };

}  // namespace chainrelay::crypto

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::crypto, Secp256k1ProviderError);

#endif  // CHAINRELAY_CRYPTO_SECP256K1_PROVIDER_HPP
