#include "chain/block_header.hpp"

#include "chain/error.hpp"
#include "chain/impl/rpc_values.hpp"

namespace chainrelay::chain {

  outcome::result<BlockHeader> parseBlockHeader(const jsonrpc::Value &block) {
    const auto *number = member(block, "number");
    const auto *hash = member(block, "hash");
    if (number == nullptr || hash == nullptr) {
      return ChainLinkError::MALFORMED_RESPONSE;
    }

    BlockHeader header;
    auto number_value = uint64Value(*number);
    if (!number_value) {
      return number_value.as_failure();
    }
    header.number = number_value.value();

    auto hash_value = hashValue(*hash);
    if (!hash_value) {
      return hash_value.as_failure();
    }
    header.hash = hash_value.value();

    if (const auto *parent = member(block, "parentHash")) {
      auto parent_value = hashValue(*parent);
      if (parent_value) {
        header.parent_hash = parent_value.value();
      }
    }
    if (const auto *timestamp = member(block, "timestamp")) {
      auto timestamp_value = uint64Value(*timestamp);
      if (timestamp_value) {
        header.timestamp = timestamp_value.value();
      }
    }
    // any length, the PoA seal lives here
    if (const auto *extra = member(block, "extraData")) {
      auto extra_value = bytesValue(*extra);
      if (extra_value) {
        header.extra_data = std::move(extra_value.value());
      }
    }
    return header;
  }

}  // namespace chainrelay::chain
