#include "relay/validator_identity.hpp"

namespace chainrelay::relay {

  ValidatorIdentity::ValidatorIdentity(
      crypto::SecretKey key,
      std::shared_ptr<crypto::Secp256k1Provider> provider,
      eth::Address address)
      : key_(std::move(key)),
        provider_(std::move(provider)),
        address_(address) {}

  outcome::result<std::shared_ptr<ValidatorIdentity>> ValidatorIdentity::create(
      crypto::SecretKey key,
      std::shared_ptr<crypto::Secp256k1Provider> provider) {
    auto public_key = provider->derivePublicKey(key);
    if (!public_key) {
      return public_key.as_failure();
    }
    auto address = eth::addressFromPublicKey(public_key.value());
    return std::shared_ptr<ValidatorIdentity>(
        new ValidatorIdentity(std::move(key), std::move(provider), address));
  }

  outcome::result<crypto::secp256k1::RecoverableSignature>
  ValidatorIdentity::sign(const crypto::secp256k1::MessageHash &hash) const {
    return provider_->sign(hash, key_);
  }

}  // namespace chainrelay::relay
