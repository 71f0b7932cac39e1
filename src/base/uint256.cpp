#include "base/uint256.hpp"

#include <algorithm>

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::base, QuantityError, e) {
  using E = chainrelay::base::QuantityError;
  switch (e) {
    case E::EMPTY_INPUT:
      return "Quantity is empty";
    case E::MISSING_0X_PREFIX:
      return "Quantity must start with 0x";
    case E::NON_HEX_INPUT:
      return "Quantity contains non-hex characters";
    case E::NON_DECIMAL_INPUT:
      return "Value contains non-decimal characters";
    case E::VALUE_OVERFLOW:
      return "Value does not fit into 256 bits";
  }
  return "Unknown quantity error";
}

namespace chainrelay::base {

  namespace {
    int hexDigit(char c) {
      if (c >= '0' && c <= '9') {
        return c - '0';
      }
      if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
      }
      if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
      }
      return -1;
    }

    const uint256_t &maxValue() {
      static const uint256_t max = ~uint256_t(0);
      return max;
    }
  }  // namespace

  outcome::result<uint256_t> parseQuantity(std::string_view quantity) {
    if (quantity.size() < 2 || quantity.substr(0, 2) != "0x") {
      return QuantityError::MISSING_0X_PREFIX;
    }
    auto digits = quantity.substr(2);
    if (digits.empty()) {
      return QuantityError::EMPTY_INPUT;
    }
    if (digits.size() > 64) {
      return QuantityError::VALUE_OVERFLOW;
    }
    uint256_t value = 0;
    for (char c : digits) {
      auto d = hexDigit(c);
      if (d < 0) {
        return QuantityError::NON_HEX_INPUT;
      }
      value = (value << 4) | static_cast<unsigned>(d);
    }
    return value;
  }

  outcome::result<uint256_t> parseDecimal(std::string_view decimal) {
    if (decimal.empty()) {
      return QuantityError::EMPTY_INPUT;
    }
    boost::multiprecision::uint512_t value = 0;
    for (char c : decimal) {
      if (c < '0' || c > '9') {
        return QuantityError::NON_DECIMAL_INPUT;
      }
      value = value * 10 + static_cast<unsigned>(c - '0');
      if (value > boost::multiprecision::uint512_t(maxValue())) {
        return QuantityError::VALUE_OVERFLOW;
      }
    }
    return static_cast<uint256_t>(value);
  }

  std::string toQuantity(const uint256_t &value) {
    if (value == 0) {
      return "0x0";
    }
    static const char *kDigits = "0123456789abcdef";
    std::string out;
    uint256_t rest = value;
    while (rest != 0) {
      out.insert(out.begin(), kDigits[static_cast<unsigned>(rest & 0xf)]);
      rest >>= 4;
    }
    return "0x" + out;
  }

  std::string toDecimal(const uint256_t &value) {
    return value.str();
  }

  Hash256 toBigEndianWord(const uint256_t &value) {
    Hash256 word;
    uint256_t rest = value;
    for (size_t i = 0; i < Hash256::size(); ++i) {
      word[Hash256::size() - 1 - i] = static_cast<uint8_t>(rest & 0xff);
      rest >>= 8;
    }
    return word;
  }

  std::vector<uint8_t> toMinimalBigEndian(const uint256_t &value) {
    auto word = toBigEndianWord(value);
    auto first = std::find_if(
        word.begin(), word.end(), [](uint8_t b) { return b != 0; });
    return {first, word.end()};
  }

  outcome::result<uint256_t> fromBigEndian(gsl::span<const uint8_t> bytes) {
    if (bytes.size() > 32) {
      return QuantityError::VALUE_OVERFLOW;
    }
    uint256_t value = 0;
    for (auto b : bytes) {
      value = (value << 8) | b;
    }
    return value;
  }

}  // namespace chainrelay::base
