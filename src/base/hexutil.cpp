#include "base/hexutil.hpp"

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::base, UnhexError, e) {
  using chainrelay::base::UnhexError;
  switch (e) {
    case UnhexError::ODD_LENGTH:
      return "Hex input has an odd number of digits";
    case UnhexError::NON_HEX_INPUT:
      return "Hex input contains a non-hex character";
    case UnhexError::MISSING_0X_PREFIX:
      return "Hex input lacks the 0x prefix";
  }
  return "Unknown hex error";
}

namespace chainrelay::base {

  std::string hex_lower(const gsl::span<const uint8_t> bytes) noexcept {
    std::string res(bytes.size() * 2, '\x00');
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), res.begin());
    return res;
  }

  std::string hex_lower_0x(const gsl::span<const uint8_t> bytes) noexcept {
    return "0x" + hex_lower(bytes);
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
      return UnhexError::ODD_LENGTH;
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);

    try {
      boost::algorithm::unhex(
          hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::hex_decode_error &) {
      return UnhexError::NON_HEX_INPUT;
    }
    return bytes;
  }

  bool hasHexPrefix(std::string_view text) {
    return text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
  }

  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex) {
    if (!hasHexPrefix(hex)) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    return unhex(hex.substr(2));
  }

  outcome::result<std::vector<uint8_t>> unhexOptional0x(std::string_view hex) {
    if (hasHexPrefix(hex)) {
      hex.remove_prefix(2);
    }
    return unhex(hex);
  }

}  // namespace chainrelay::base
