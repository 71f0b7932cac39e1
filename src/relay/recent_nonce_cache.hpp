#ifndef CHAINRELAY_RELAY_RECENT_NONCE_CACHE_HPP
#define CHAINRELAY_RELAY_RECENT_NONCE_CACHE_HPP

#include <deque>
#include <map>
#include <mutex>
#include <optional>

#include "base/blob.hpp"
#include "base/uint256.hpp"

namespace chainrelay::relay {

  /**
   * @brief Nonces this process submitted recently, with their transaction
   * hashes. Bounded; the oldest entry is evicted first. Only a fast path:
   * the destination contract's processed-nonce predicate stays the
   * authority.
   */
  class RecentNonceCache {
   public:
    static constexpr size_t kDefaultCapacity = 1024;

    explicit RecentNonceCache(size_t capacity = kDefaultCapacity);

    std::optional<base::Hash256> find(const base::uint256_t &nonce) const;

    void insert(const base::uint256_t &nonce, const base::Hash256 &tx_hash);

    size_t size() const;

    size_t capacity() const {
      return capacity_;
    }

   private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::map<base::uint256_t, base::Hash256> entries_;
    std::deque<base::uint256_t> order_;
  };

}  // namespace chainrelay::relay

#endif  // CHAINRELAY_RELAY_RECENT_NONCE_CACHE_HPP
