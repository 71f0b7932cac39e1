#include "validation/rules/completeness_rule.hpp"

namespace chainrelay::validation
{
    ValidationVerdict CompletenessRule::check( const primitives::BridgeEvent &event )
    {
        if ( !event.from || !event.to || !event.amount || !event.nonce )
        {
            return ValidationVerdict::fail( reasons::kMalformedEvent );
        }
        return ValidationVerdict::pass();
    }
}
