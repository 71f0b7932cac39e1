#include "validation/rules/minimum_amount_rule.hpp"

namespace chainrelay::validation
{
    ValidationVerdict MinimumAmountRule::check( const primitives::BridgeEvent &event )
    {
        if ( !event.amount )
        {
            return ValidationVerdict::fail( reasons::kMalformedEvent );
        }
        if ( *event.amount < minimum_ )
        {
            return ValidationVerdict::fail( reasons::kBelowThreshold );
        }
        return ValidationVerdict::pass();
    }
}
