#ifndef CHAINRELAY_ETH_ABI_HPP
#define CHAINRELAY_ETH_ABI_HPP

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <gsl/span>
#include "base/blob.hpp"
#include "base/uint256.hpp"
#include "eth/address.hpp"
#include "outcome/outcome.hpp"

namespace chainrelay::eth {

  enum class AbiError {
    INVALID_JSON = 1,
    UNKNOWN_FUNCTION,
    UNKNOWN_EVENT,
    ARGUMENT_COUNT_MISMATCH,
    TYPE_MISMATCH,
    UNSUPPORTED_TYPE,
    MALFORMED_DATA,
    TOPIC_MISMATCH
  };

  /**
   * Value of a static ABI type: address, uintN, bool or bytesN (left aligned)
   */
  using AbiValue = std::variant<Address, base::uint256_t, bool, base::Hash256>;

  using Selector = std::array<uint8_t, 4>;

  struct AbiParam {
    std::string name;
    std::string type;  ///< canonical form, "uint" is stored as "uint256"
    bool indexed = false;
  };

  struct AbiFunction {
    std::string name;
    std::vector<AbiParam> inputs;
    std::vector<AbiParam> outputs;
    std::string state_mutability;

    /// e.g. "mint(address,uint256,uint256)"
    [[nodiscard]] std::string signature() const;
    [[nodiscard]] Selector selector() const;
  };

  struct AbiEvent {
    std::string name;
    std::vector<AbiParam> inputs;
    bool anonymous = false;

    /// e.g. "TokensLocked(address,address,uint256,uint256)"
    [[nodiscard]] std::string signature() const;
    /// keccak256 of the signature, emitted as topics[0]
    [[nodiscard]] base::Hash256 topic() const;
  };

  /**
   * @brief Contract ABI parsed from its JSON description. Only static types
   * are encoded and decoded; dynamic parameters are skipped when decoding
   * logs and rejected when encoding calls.
   */
  class ContractAbi {
   public:
    static outcome::result<ContractAbi> parse(std::string_view json);

    [[nodiscard]] const AbiFunction *findFunction(std::string_view name) const;
    [[nodiscard]] const AbiEvent *findEvent(std::string_view name) const;

    [[nodiscard]] const std::vector<AbiFunction> &functions() const {
      return functions_;
    }
    [[nodiscard]] const std::vector<AbiEvent> &events() const {
      return events_;
    }

    /**
     * @brief Selector followed by the head-encoded arguments
     */
    outcome::result<std::vector<uint8_t>> encodeCall(
        std::string_view function, const std::vector<AbiValue> &args) const;

    /**
     * @brief Decodes the return data of an eth_call
     */
    outcome::result<std::vector<AbiValue>> decodeOutput(
        std::string_view function, gsl::span<const uint8_t> data) const;

    /**
     * @brief Decodes the arguments of an event log by parameter name.
     *
     * Decoding is lenient: parameters that have no topic or data word, or that
     * are of a dynamic type, are left out of the result instead of failing the
     * whole log. Only a topic[0] that does not belong to the event is an error.
     */
    outcome::result<std::map<std::string, AbiValue>> decodeLog(
        const AbiEvent &event,
        const std::vector<base::Hash256> &topics,
        gsl::span<const uint8_t> data) const;

   private:
    std::vector<AbiFunction> functions_;
    std::vector<AbiEvent> events_;
  };

  /// Canonical spelling of a Solidity type ("uint" -> "uint256")
  std::string canonicalType(std::string_view type);

  /// True for address, bool, uint8..uint256 and bytes1..bytes32
  bool isSupportedStaticType(std::string_view type);

  outcome::result<base::Hash256> encodeWord(std::string_view type,
                                            const AbiValue &value);

  outcome::result<AbiValue> decodeWord(std::string_view type,
                                       const base::Hash256 &word);

}  // namespace chainrelay::eth

OUTCOME_HPP_DECLARE_ERROR_2(chainrelay::eth, AbiError);

#endif  // CHAINRELAY_ETH_ABI_HPP
