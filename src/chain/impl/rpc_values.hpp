#ifndef CHAINRELAY_CHAIN_IMPL_RPC_VALUES_HPP
#define CHAINRELAY_CHAIN_IMPL_RPC_VALUES_HPP

#include <string>
#include <vector>

#include <jsonrpc-lean/value.h>

#include "base/blob.hpp"
#include "base/uint256.hpp"
#include "eth/address.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::chain {

  /**
   * Readers for the hex encoded members of Ethereum json-rpc results. All of
   * them fail with ChainLinkError::MALFORMED_RESPONSE.
   */
  outcome::result<std::string> stringValue(const jsonrpc::Value &value);

  outcome::result<base::uint256_t> quantityValue(const jsonrpc::Value &value);

  outcome::result<uint64_t> uint64Value(const jsonrpc::Value &value);

  outcome::result<std::vector<uint8_t>> bytesValue(const jsonrpc::Value &value);

  outcome::result<base::Hash256> hashValue(const jsonrpc::Value &value);

  outcome::result<eth::Address> addressValue(const jsonrpc::Value &value);

  /// Member of a struct value, or nullptr when absent or null
  const jsonrpc::Value *member(const jsonrpc::Value &value,
                               const std::string &name);

}  // namespace chainrelay::chain

#endif  // CHAINRELAY_CHAIN_IMPL_RPC_VALUES_HPP
