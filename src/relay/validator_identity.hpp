#ifndef CHAINRELAY_RELAY_VALIDATOR_IDENTITY_HPP
#define CHAINRELAY_RELAY_VALIDATOR_IDENTITY_HPP

#include <memory>

#include "crypto/secp256k1/secp256k1_provider.hpp"
#include "crypto/secret_key.hpp"
#include "eth/address.hpp"

namespace chainrelay::relay {

  /**
   * @brief The single account this relayer signs with. Owns the private key
   * for the life of the process; the key is read-only after creation and
   * only leaves this object as a signature.
   */
  class ValidatorIdentity {
   public:
    /**
     * @param key private key
     * @param provider curve implementation
     * @return identity whose address is derived from the key
     */
    static outcome::result<std::shared_ptr<ValidatorIdentity>> create(
        crypto::SecretKey key,
        std::shared_ptr<crypto::Secp256k1Provider> provider);

    const eth::Address &address() const {
      return address_;
    }

    outcome::result<crypto::secp256k1::RecoverableSignature> sign(
        const crypto::secp256k1::MessageHash &hash) const;

   private:
    ValidatorIdentity(crypto::SecretKey key,
                      std::shared_ptr<crypto::Secp256k1Provider> provider,
                      eth::Address address);

    crypto::SecretKey key_;
    std::shared_ptr<crypto::Secp256k1Provider> provider_;
    eth::Address address_;
  };

}  // namespace chainrelay::relay

#endif  // CHAINRELAY_RELAY_VALIDATOR_IDENTITY_HPP
