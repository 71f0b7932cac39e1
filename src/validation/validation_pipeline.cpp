#include "validation/validation_pipeline.hpp"

namespace chainrelay::validation
{
    ValidationPipeline::ValidationPipeline( std::vector<std::shared_ptr<ValidationRule>> rules ) :
        rules_( std::move( rules ) )
    {
    }

    ValidationVerdict ValidationPipeline::validate( const primitives::BridgeEvent &event )
    {
        for ( const auto &rule : rules_ )
        {
            auto verdict = rule->check( event );
            if ( !verdict.passed )
            {
                logger_->warn( "ValidationFailure: nonce {} rejected by {}: {}", event.nonceText(), rule->name(),
                               verdict.reason.value_or( "" ) );
                return verdict;
            }
            logger_->debug( "Nonce {} passed {}", event.nonceText(), rule->name() );
        }
        logger_->info( "Validation successful for nonce {}", event.nonceText() );
        return ValidationVerdict::pass();
    }
}
