#ifndef CHAINRELAY_VALIDATION_VALIDATION_RULE_HPP
#define CHAINRELAY_VALIDATION_VALIDATION_RULE_HPP

#include <string>

#include "primitives/bridge_event.hpp"
#include "validation/validation_verdict.hpp"

namespace chainrelay::validation
{
    /**
     * One independent check an event must pass before it is relayed. Rules
     * never write to a chain.
     */
    class ValidationRule
    {
    public:
        virtual ~ValidationRule() = default;

        virtual std::string name() const = 0;

        virtual ValidationVerdict check( const primitives::BridgeEvent &event ) = 0;
    };
}

#endif // CHAINRELAY_VALIDATION_VALIDATION_RULE_HPP
