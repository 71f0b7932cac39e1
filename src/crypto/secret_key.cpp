#include "crypto/secret_key.hpp"

#include <openssl/crypto.h>

#include "base/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::crypto, SecretKeyError, e) {
  using E = chainrelay::crypto::SecretKeyError;
  switch (e) {
    case E::INVALID_ENCODING:
      return "Secret key is not valid hex";
    case E::INVALID_LENGTH:
      return "Secret key must be exactly 32 bytes";
  }
  return "Unknown secret key error";
}

namespace chainrelay::crypto {

  outcome::result<SecretKey> SecretKey::fromHex(std::string_view hex) {
    auto bytes = base::unhexOptional0x(hex);
    if (!bytes) {
      return SecretKeyError::INVALID_ENCODING;
    }
    auto key = fromBytes(bytes.value());
    OPENSSL_cleanse(bytes.value().data(), bytes.value().size());
    return key;
  }

  outcome::result<SecretKey> SecretKey::fromBytes(
      gsl::span<const uint8_t> bytes) {
    if (static_cast<size_t>(bytes.size()) != secp256k1::constants::kPrivateKeySize) {
      return SecretKeyError::INVALID_LENGTH;
    }
    SecretKey key;
    std::copy(bytes.begin(), bytes.end(), key.bytes_.begin());
    return key;
  }

  SecretKey::SecretKey(SecretKey &&other) noexcept : bytes_(other.bytes_) {
    other.wipe();
  }

  SecretKey &SecretKey::operator=(SecretKey &&other) noexcept {
    if (this != &other) {
      bytes_ = other.bytes_;
      other.wipe();
    }
    return *this;
  }

  SecretKey::~SecretKey() {
    wipe();
  }

  void SecretKey::wipe() noexcept {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
  }

}  // namespace chainrelay::crypto
