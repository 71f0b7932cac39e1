#ifndef CHAINRELAY_VALIDATION_RULES_COMPLETENESS_RULE_HPP
#define CHAINRELAY_VALIDATION_RULES_COMPLETENESS_RULE_HPP

#include "validation/validation_rule.hpp"

namespace chainrelay::validation
{
    /// from, to, amount and nonce must all be present
    class CompletenessRule : public ValidationRule
    {
    public:
        std::string name() const override
        {
            return "completeness";
        }

        ValidationVerdict check( const primitives::BridgeEvent &event ) override;
    };
}

#endif // CHAINRELAY_VALIDATION_RULES_COMPLETENESS_RULE_HPP
