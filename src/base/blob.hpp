#ifndef CHAINRELAY_BLOB_HPP
#define CHAINRELAY_BLOB_HPP

#include <array>
#include <cstddef>
#include <ostream>

#include "base/hexutil.hpp"

namespace chainrelay::base {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  /**
   * Fixed size byte string: hashes, addresses, curve scalars. Zero filled
   * on construction.
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
   public:
    Blob() {
      this->fill(0);
    }

    constexpr static size_t size() {
      return size_;
    }

    [[nodiscard]] std::string toHex() const noexcept {
      return hex_lower(gsl::make_span(*this));
    }

    /// form used in JSON-RPC requests and log lines
    [[nodiscard]] std::string toHexWithPrefix() const noexcept {
      return hex_lower_0x(gsl::make_span(*this));
    }

    /**
     * @param hex exactly 2 * size_ digits, optionally 0x prefixed
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      auto res = unhexOptional0x(hex);
      if (!res) {
        return res.as_failure();
      }
      return fromSpan(res.value());
    }

    /**
     * @param span source bytes, must be exactly size_ long
     */
    static outcome::result<Blob<size_>> fromSpan(
        gsl::span<const uint8_t> span) {
      if (static_cast<size_t>(span.size()) != size_) {
        return BlobError::INCORRECT_LENGTH;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  extern template class Blob<20ul>;
  extern template class Blob<32ul>;

  using Hash256 = Blob<32>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHexWithPrefix();
  }

}  // namespace chainrelay::base

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::base, BlobError);

#endif  // CHAINRELAY_BLOB_HPP
