#ifndef CHAINRELAY_VALIDATION_VALIDATION_VERDICT_HPP
#define CHAINRELAY_VALIDATION_VALIDATION_VERDICT_HPP

#include <optional>
#include <string>

namespace chainrelay::validation
{
    /**
     * Outcome of validating one event; a failed verdict carries the reason
     */
    struct ValidationVerdict
    {
        bool                       passed = true;
        std::optional<std::string> reason;

        static ValidationVerdict pass()
        {
            return ValidationVerdict{};
        }

        static ValidationVerdict fail( std::string why )
        {
            return ValidationVerdict{ false, std::move( why ) };
        }
    };

    namespace reasons
    {
        constexpr auto kMalformedEvent = "malformed event";
        constexpr auto kBelowThreshold = "below threshold";
        constexpr auto kMarketPrice    = "market price below processing threshold";
    }
}

#endif // CHAINRELAY_VALIDATION_VALIDATION_VERDICT_HPP
