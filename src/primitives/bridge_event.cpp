#include "primitives/bridge_event.hpp"

namespace chainrelay::primitives {

  namespace {
    template <typename T>
    std::optional<T> argument(const chain::EventLog &log,
                              const std::string &name) {
      auto it = log.args.find(name);
      if (it == log.args.end()) {
        return std::nullopt;
      }
      if (const auto *value = std::get_if<T>(&it->second)) {
        return *value;
      }
      return std::nullopt;
    }
  }  // namespace

  BridgeEvent BridgeEvent::fromLog(const chain::EventLog &log,
                                   uint64_t source_chain_id) {
    BridgeEvent event;
    event.source_chain_id = source_chain_id;
    event.source_tx_hash = log.transaction_hash;
    event.block_number = log.block_number;
    event.from = argument<eth::Address>(log, "from");
    event.to = argument<eth::Address>(log, "to");
    event.amount = argument<base::uint256_t>(log, "amount");
    event.nonce = argument<base::uint256_t>(log, "nonce");
    return event;
  }

  std::string BridgeEvent::nonceText() const {
    return nonce ? base::toDecimal(*nonce) : std::string("?");
  }

}  // namespace chainrelay::primitives
