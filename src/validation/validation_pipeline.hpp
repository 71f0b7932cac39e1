#ifndef CHAINRELAY_VALIDATION_VALIDATION_PIPELINE_HPP
#define CHAINRELAY_VALIDATION_VALIDATION_PIPELINE_HPP

#include <memory>
#include <vector>

#include "base/logger.hpp"
#include "validation/validation_rule.hpp"

namespace chainrelay::validation
{
    /**
     * Runs rules in the order given and stops at the first failure, whose
     * reason becomes the verdict's reason.
     */
    class ValidationPipeline
    {
    public:
        explicit ValidationPipeline( std::vector<std::shared_ptr<ValidationRule>> rules );

        ValidationVerdict validate( const primitives::BridgeEvent &event );

        const std::vector<std::shared_ptr<ValidationRule>> &rules() const
        {
            return rules_;
        }

    private:
        std::vector<std::shared_ptr<ValidationRule>> rules_;
        base::Logger                                 logger_ = base::createLogger( "ValidationPipeline" );
    };
}

#endif // CHAINRELAY_VALIDATION_VALIDATION_PIPELINE_HPP
