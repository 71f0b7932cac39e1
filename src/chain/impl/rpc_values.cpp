#include "chain/impl/rpc_values.hpp"

#include <limits>

#include "base/hexutil.hpp"
#include "chain/error.hpp"

namespace chainrelay::chain {

  outcome::result<std::string> stringValue(const jsonrpc::Value &value) {
    if (!value.IsString()) {
      return ChainLinkError::MALFORMED_RESPONSE;
    }
    return value.AsString();
  }

  outcome::result<base::uint256_t> quantityValue(const jsonrpc::Value &value) {
    auto text = stringValue(value);
    if (!text) {
      return text.as_failure();
    }
    auto quantity = base::parseQuantity(text.value());
    if (!quantity) {
      return ChainLinkError::MALFORMED_RESPONSE;
    }
    return quantity.value();
  }

  outcome::result<uint64_t> uint64Value(const jsonrpc::Value &value) {
    auto quantity = quantityValue(value);
    if (!quantity) {
      return quantity.as_failure();
    }
    if (quantity.value() > std::numeric_limits<uint64_t>::max()) {
      return ChainLinkError::MALFORMED_RESPONSE;
    }
    return quantity.value().convert_to<uint64_t>();
  }

  outcome::result<std::vector<uint8_t>> bytesValue(
      const jsonrpc::Value &value) {
    auto text = stringValue(value);
    if (!text) {
      return text.as_failure();
    }
    auto bytes = base::unhexWith0x(text.value());
    if (!bytes) {
      return ChainLinkError::MALFORMED_RESPONSE;
    }
    return bytes.value();
  }

  outcome::result<base::Hash256> hashValue(const jsonrpc::Value &value) {
    auto bytes = bytesValue(value);
    if (!bytes) {
      return bytes.as_failure();
    }
    auto hash = base::Hash256::fromSpan(bytes.value());
    if (!hash) {
      return ChainLinkError::MALFORMED_RESPONSE;
    }
    return hash.value();
  }

  outcome::result<eth::Address> addressValue(const jsonrpc::Value &value) {
    auto bytes = bytesValue(value);
    if (!bytes) {
      return bytes.as_failure();
    }
    auto address = eth::Address::fromSpan(bytes.value());
    if (!address) {
      return ChainLinkError::MALFORMED_RESPONSE;
    }
    return address.value();
  }

  const jsonrpc::Value *member(const jsonrpc::Value &value,
                               const std::string &name) {
    if (!value.IsStruct()) {
      return nullptr;
    }
    const auto &fields = value.AsStruct();
    auto it = fields.find(name);
    if (it == fields.end() || it->second.IsNil()) {
      return nullptr;
    }
    return &it->second;
  }

}  // namespace chainrelay::chain
