#ifndef CHAINRELAY_CRYPTO_SECRET_KEY_HPP
#define CHAINRELAY_CRYPTO_SECRET_KEY_HPP

#include <array>
#include <string_view>

#include <gsl/span>
#include "crypto/secp256k1_types.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::crypto {

  enum class SecretKeyError { INVALID_ENCODING = 1, INVALID_LENGTH };

  /**
   * @brief Validator signing key. Wiped from memory on destruction and never
   * printable: the type has no stream or fmt formatter and no copy.
   */
  class SecretKey {
   public:
    /**
     * @brief Parses a 32-byte key from hex, with or without 0x prefix
     */
    static outcome::result<SecretKey> fromHex(std::string_view hex);

    static outcome::result<SecretKey> fromBytes(gsl::span<const uint8_t> bytes);

    SecretKey(SecretKey &&other) noexcept;
    SecretKey &operator=(SecretKey &&other) noexcept;
    SecretKey(const SecretKey &) = delete;
    SecretKey &operator=(const SecretKey &) = delete;
    ~SecretKey();

    [[nodiscard]] gsl::span<const uint8_t> bytes() const {
      return gsl::make_span(bytes_);
    }

   private:
    SecretKey() = default;
    void wipe() noexcept;

    std::array<uint8_t, secp256k1::constants::kPrivateKeySize> bytes_{};
  };

}  // namespace chainrelay::crypto

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::crypto, SecretKeyError);

#endif  // CHAINRELAY_CRYPTO_SECRET_KEY_HPP
