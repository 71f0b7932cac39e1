#ifndef CHAINRELAY_VALIDATION_RULES_MINIMUM_AMOUNT_RULE_HPP
#define CHAINRELAY_VALIDATION_RULES_MINIMUM_AMOUNT_RULE_HPP

#include "base/uint256.hpp"
#include "validation/validation_rule.hpp"

namespace chainrelay::validation
{
    class MinimumAmountRule : public ValidationRule
    {
    public:
        /// @param minimum smallest accepted amount in token base units
        explicit MinimumAmountRule( base::uint256_t minimum ) : minimum_( std::move( minimum ) ) {}

        std::string name() const override
        {
            return "minimum amount";
        }

        ValidationVerdict check( const primitives::BridgeEvent &event ) override;

    private:
        base::uint256_t minimum_;
    };
}

#endif // CHAINRELAY_VALIDATION_RULES_MINIMUM_AMOUNT_RULE_HPP
