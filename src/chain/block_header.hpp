#ifndef CHAINRELAY_CHAIN_BLOCK_HEADER_HPP
#define CHAINRELAY_CHAIN_BLOCK_HEADER_HPP

#include <vector>

#include <jsonrpc-lean/value.h>

#include "base/blob.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::chain {

  /**
   * Fields of an eth_getBlockByNumber result the relayer relies on
   */
  struct BlockHeader {
    uint64_t number = 0;
    base::Hash256 hash;
    base::Hash256 parent_hash;
    uint64_t timestamp = 0;
    std::vector<uint8_t> extra_data;
  };

  /**
   * @brief Reads a block header the way proof-of-authority chains (Clique,
   * Polygon Bor) serve it: extraData longer than 32 bytes carries the sealer
   * signature and is accepted, and the proof-of-work members mixHash, nonce
   * and difficulty may be missing or zero.
   * @return ChainLinkError::MALFORMED_RESPONSE if number or hash is missing
   */
  outcome::result<BlockHeader> parseBlockHeader(const jsonrpc::Value &block);

}  // namespace chainrelay::chain

#endif  // CHAINRELAY_CHAIN_BLOCK_HEADER_HPP
