#include "chain/impl/evm_log_filter.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include "chain/error.hpp"
#include "chain/impl/rpc_values.hpp"

namespace chainrelay::chain
{
    EvmLogFilter::EvmLogFilter( std::shared_ptr<api::JsonRpcClient> client, std::string id, eth::ContractAbi abi,
                                eth::AbiEvent event, bool backfill, base::Logger logger ) :
        client_( std::move( client ) ),
        id_( std::move( id ) ),
        abi_( std::move( abi ) ),
        event_( std::move( event ) ),
        backfill_pending_( backfill ),
        logger_( std::move( logger ) )
    {
    }

    outcome::result<std::vector<EventLog>> EvmLogFilter::getNewEntries()
    {
        std::vector<EventLog> logs;
        if ( backfill_pending_ )
        {
            auto history = fetch( "eth_getFilterLogs" );
            if ( !history )
            {
                return history.as_failure();
            }
            for ( auto &log : history.value() )
            {
                if ( backfilled_.emplace( log.transaction_hash, log.log_index ).second )
                {
                    logs.push_back( std::move( log ) );
                }
            }
            backfill_pending_ = false;
            logger_->info( "Filter {} backfilled {} log(s)", id_, logs.size() );
        }

        auto changes = fetch( "eth_getFilterChanges" );
        if ( !changes )
        {
            return changes.as_failure();
        }
        for ( auto &log : changes.value() )
        {
            if ( backfilled_.count( LogKey{ log.transaction_hash, log.log_index } ) != 0 )
            {
                logger_->debug( "Skipping log already backfilled, tx {}", log.transaction_hash.toHexWithPrefix() );
                continue;
            }
            logs.push_back( std::move( log ) );
        }
        return logs;
    }

    outcome::result<std::vector<EventLog>> EvmLogFilter::fetch( const std::string &method )
    {
        auto changes = client_->call( method, { jsonrpc::Value( id_ ) } );
        if ( !changes )
        {
            if ( changes.error() == api::JsonRpcError::NODE_ERROR &&
                 boost::algorithm::icontains( client_->lastFault()->message, "filter not found" ) )
            {
                return ChainLinkError::FILTER_NOT_FOUND;
            }
            return ChainLinkError::CALL_FAILED;
        }
        if ( !changes.value().IsArray() )
        {
            return ChainLinkError::MALFORMED_RESPONSE;
        }

        std::vector<EventLog> logs;
        for ( const auto &entry : changes.value().AsArray() )
        {
            const auto *removed = member( entry, "removed" );
            if ( removed != nullptr && removed->IsBoolean() && removed->AsBoolean() )
            {
                const auto *tx = member( entry, "transactionHash" );
                logger_->warn( "Dropping log removed by reorganization, tx {}",
                               tx != nullptr && tx->IsString() ? tx->AsString() : std::string( "unknown" ) );
                continue;
            }
            auto log = parseEntry( entry );
            if ( !log )
            {
                logger_->warn( "Dropping malformed log entry from filter {}", id_ );
                continue;
            }
            logs.push_back( std::move( *log ) );
        }
        return logs;
    }

    std::optional<EventLog> EvmLogFilter::parseEntry( const jsonrpc::Value &entry ) const
    {
        const auto *address = member( entry, "address" );
        const auto *topics  = member( entry, "topics" );
        const auto *data    = member( entry, "data" );
        const auto *block   = member( entry, "blockNumber" );
        const auto *tx_hash = member( entry, "transactionHash" );
        if ( address == nullptr || topics == nullptr || !topics->IsArray() || data == nullptr || block == nullptr ||
             tx_hash == nullptr )
        {
            return std::nullopt;
        }

        EventLog log;
        auto     address_value = addressValue( *address );
        auto     data_value    = bytesValue( *data );
        auto     block_value   = uint64Value( *block );
        auto     hash_value    = hashValue( *tx_hash );
        if ( !address_value || !data_value || !block_value || !hash_value )
        {
            return std::nullopt;
        }
        log.address          = address_value.value();
        log.data             = std::move( data_value.value() );
        log.block_number     = block_value.value();
        log.transaction_hash = hash_value.value();

        for ( const auto &topic : topics->AsArray() )
        {
            auto topic_value = hashValue( topic );
            if ( !topic_value )
            {
                return std::nullopt;
            }
            log.topics.push_back( topic_value.value() );
        }
        if ( const auto *index = member( entry, "logIndex" ) )
        {
            auto index_value = uint64Value( *index );
            if ( index_value )
            {
                log.log_index = index_value.value();
            }
        }

        auto args = abi_.decodeLog( event_, log.topics, log.data );
        if ( args )
        {
            log.args = std::move( args.value() );
        }
        else
        {
            logger_->debug( "Log in tx {} does not decode as {}: {}", log.transaction_hash.toHexWithPrefix(),
                            event_.name, args.error().message() );
        }
        return log;
    }
} // namespace chainrelay::chain
