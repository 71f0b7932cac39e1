#ifndef CHAINRELAY_CHAIN_IMPL_EVM_LOG_FILTER_HPP
#define CHAINRELAY_CHAIN_IMPL_EVM_LOG_FILTER_HPP

#include <set>
#include <utility>

#include "api/jrpc/json_rpc_client.hpp"
#include "base/logger.hpp"
#include "chain/log_filter.hpp"
#include "eth/abi.hpp"

namespace chainrelay::chain {

  /**
   * Filter installed with eth_newFilter and drained with eth_getFilterChanges.
   * A filter created from a past block first reads the history with
   * eth_getFilterLogs, since eth_getFilterChanges only reports logs that
   * arrive after installation.
   */
  class EvmLogFilter : public LogFilter {
   public:
    EvmLogFilter(std::shared_ptr<api::JsonRpcClient> client,
                 std::string id,
                 eth::ContractAbi abi,
                 eth::AbiEvent event,
                 bool backfill,
                 base::Logger logger);

    outcome::result<std::vector<EventLog>> getNewEntries() override;

    const std::string &id() const override {
      return id_;
    }

   private:
    using LogKey = std::pair<base::Hash256, uint64_t>;

    outcome::result<std::vector<EventLog>> fetch(const std::string &method);
    std::optional<EventLog> parseEntry(const jsonrpc::Value &entry) const;

    std::shared_ptr<api::JsonRpcClient> client_;
    std::string id_;
    eth::ContractAbi abi_;
    eth::AbiEvent event_;
    bool backfill_pending_;
    /// (tx hash, log index) of backfilled entries
    std::set<LogKey> backfilled_;
    base::Logger logger_;
  };

}  // namespace chainrelay::chain

#endif  // CHAINRELAY_CHAIN_IMPL_EVM_LOG_FILTER_HPP
