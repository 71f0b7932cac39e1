#ifndef CHAINRELAY_CRYPTO_SECP256K1_PROVIDER_IMPL_HPP
#define CHAINRELAY_CRYPTO_SECP256K1_PROVIDER_IMPL_HPP

#include <memory>

#include <secp256k1.h>

#include "crypto/secp256k1/secp256k1_provider.hpp"

namespace chainrelay::crypto {

  /**
   * libsecp256k1 backed implementation. Nonces follow RFC6979, so a key and
   * digest always give the same signature. The context is created once and
   * only read afterwards, so one instance may be shared by threads.
   */
  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    Secp256k1ProviderImpl();
    ~Secp256k1ProviderImpl() override = default;

    outcome::result<secp256k1::UncompressedPublicKey> derivePublicKey(
        const SecretKey &key) const override;

    outcome::result<secp256k1::RecoverableSignature> sign(
        const secp256k1::MessageHash &hash,
        const SecretKey &key) const override;

    outcome::result<secp256k1::UncompressedPublicKey> recoverPublicKey(
        const secp256k1::MessageHash &hash,
        const secp256k1::RecoverableSignature &signature) const override;

   private:
    struct ContextDeleter {
      void operator()(secp256k1_context *context) const {
        secp256k1_context_destroy(context);
      }
    };

    outcome::result<secp256k1::UncompressedPublicKey> serialize(
        const secp256k1_pubkey &public_key) const;

    std::unique_ptr<secp256k1_context, ContextDeleter> context_;
  };

}  // namespace chainrelay::crypto

#endif  // CHAINRELAY_CRYPTO_SECP256K1_PROVIDER_IMPL_HPP
