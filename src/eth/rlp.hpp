#ifndef CHAINRELAY_ETH_RLP_HPP
#define CHAINRELAY_ETH_RLP_HPP

#include <vector>

#include <gsl/span>
#include "base/uint256.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::eth::rlp {

  enum class RlpError {
    UNEXPECTED_END = 1,
    NON_CANONICAL_SIZE,
    TRAILING_BYTES,
    UNEXPECTED_LIST,
    UNEXPECTED_STRING
  };

  using Bytes = std::vector<uint8_t>;

  /**
   * @brief Encodes a byte string
   */
  Bytes encodeBytes(gsl::span<const uint8_t> bytes);

  /**
   * @brief Encodes an unsigned integer as its minimal big-endian byte string;
   * zero is the empty string
   */
  Bytes encodeInteger(const base::uint256_t &value);

  /**
   * @brief Wraps already-encoded items into a list
   */
  Bytes encodeList(const std::vector<Bytes> &encoded_items);

  /**
   * Decoded RLP item. Either a byte string or a list of items.
   */
  struct Item {
    bool is_list = false;
    Bytes bytes;
    std::vector<Item> items;

    outcome::result<base::uint256_t> asInteger() const;
  };

  /**
   * @brief Decodes exactly one item spanning the whole input
   */
  outcome::result<Item> decode(gsl::span<const uint8_t> input);

}  // namespace chainrelay::eth::rlp

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::eth::rlp, RlpError);

#endif  // CHAINRELAY_ETH_RLP_HPP
