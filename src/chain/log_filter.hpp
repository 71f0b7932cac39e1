#ifndef CHAINRELAY_CHAIN_LOG_FILTER_HPP
#define CHAINRELAY_CHAIN_LOG_FILTER_HPP

#include <string>
#include <vector>

#include "chain/event_log.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::chain {

  /**
   * Server side log filter on one event of one contract
   */
  class LogFilter {
   public:
    virtual ~LogFilter() = default;

    /**
     * @brief Entries that appeared since the previous call, in log order.
     * The first call on a filter created from a past block also returns the
     * entries from that block on. Entries removed by a reorganization are
     * not returned.
     */
    virtual outcome::result<std::vector<EventLog>> getNewEntries() = 0;

    virtual const std::string &id() const = 0;
  };

}  // namespace chainrelay::chain

#endif  // CHAINRELAY_CHAIN_LOG_FILTER_HPP
