#include "relay/recent_nonce_cache.hpp"

namespace chainrelay::relay {

  RecentNonceCache::RecentNonceCache(size_t capacity)
      : capacity_(capacity == 0 ? 1 : capacity) {}

  std::optional<base::Hash256> RecentNonceCache::find(
      const base::uint256_t &nonce) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(nonce);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void RecentNonceCache::insert(const base::uint256_t &nonce,
                                const base::Hash256 &tx_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.emplace(nonce, tx_hash);
    if (!inserted) {
      it->second = tx_hash;
      return;
    }
    order_.push_back(nonce);
    while (order_.size() > capacity_) {
      entries_.erase(order_.front());
      order_.pop_front();
    }
  }

  size_t RecentNonceCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

}  // namespace chainrelay::relay
