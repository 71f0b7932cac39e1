#ifndef CHAINRELAY_CHAIN_EVENT_LOG_HPP
#define CHAINRELAY_CHAIN_EVENT_LOG_HPP

#include <map>
#include <string>
#include <vector>

#include "base/blob.hpp"
#include "eth/abi.hpp"
#include "eth/address.hpp"

namespace chainrelay::chain {

  /**
   * Log entry returned by a filter, with the arguments the watched event's
   * ABI could decode
   */
  struct EventLog {
    eth::Address address;
    std::vector<base::Hash256> topics;
    std::vector<uint8_t> data;
    uint64_t block_number = 0;
    base::Hash256 transaction_hash;
    uint64_t log_index = 0;
    std::map<std::string, eth::AbiValue> args;
  };

}  // namespace chainrelay::chain

#endif  // CHAINRELAY_CHAIN_EVENT_LOG_HPP
