#ifndef CHAINRELAY_APPLICATION_DEFAULT_ABIS_HPP
#define CHAINRELAY_APPLICATION_DEFAULT_ABIS_HPP

namespace chainrelay::application {

  /// Source bridge: emits TokensLocked(from, to, amount, nonce)
  constexpr auto kDefaultSourceAbi = R"([{
    "anonymous": false,
    "inputs": [
      {"indexed": true, "internalType": "address", "name": "from", "type": "address"},
      {"indexed": true, "internalType": "address", "name": "to", "type": "address"},
      {"indexed": false, "internalType": "uint256", "name": "amount", "type": "uint256"},
      {"indexed": false, "internalType": "uint256", "name": "nonce", "type": "uint256"}
    ],
    "name": "TokensLocked",
    "type": "event"
  }])";

  /// Destination bridge: mint(recipient, amount, sourceNonce) guarded by
  /// processedNonces(nonce)
  constexpr auto kDefaultDestinationAbi = R"([{
    "inputs": [
      {"internalType": "address", "name": "recipient", "type": "address"},
      {"internalType": "uint256", "name": "amount", "type": "uint256"},
      {"internalType": "uint256", "name": "sourceNonce", "type": "uint256"}
    ],
    "name": "mint",
    "outputs": [],
    "stateMutability": "nonpayable",
    "type": "function"
  }, {
    "inputs": [
      {"internalType": "uint256", "name": "", "type": "uint256"}
    ],
    "name": "processedNonces",
    "outputs": [
      {"internalType": "bool", "name": "", "type": "bool"}
    ],
    "stateMutability": "view",
    "type": "function"
  }])";

}  // namespace chainrelay::application

#endif  // CHAINRELAY_APPLICATION_DEFAULT_ABIS_HPP
