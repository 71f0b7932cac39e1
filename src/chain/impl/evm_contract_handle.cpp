#include "chain/impl/evm_contract_handle.hpp"

#include "base/hexutil.hpp"
#include "chain/impl/evm_log_filter.hpp"
#include "chain/impl/rpc_values.hpp"

namespace chainrelay::chain
{
    EvmContractHandle::EvmContractHandle( std::shared_ptr<api::JsonRpcClient> client, eth::Address address,
                                          eth::ContractAbi abi, base::Logger logger ) :
        client_( std::move( client ) ),
        address_( address ),
        abi_( std::move( abi ) ),
        logger_( std::move( logger ) )
    {
    }

    outcome::result<std::vector<eth::AbiValue>> EvmContractHandle::call( const std::string              &function,
                                                                         const std::vector<eth::AbiValue> &args )
    {
        auto calldata = abi_.encodeCall( function, args );
        if ( !calldata )
        {
            return calldata.as_failure();
        }

        jsonrpc::Value::Struct request;
        request["to"]   = jsonrpc::Value( address_.toHexWithPrefix() );
        request["data"] = jsonrpc::Value( base::hex_lower_0x( calldata.value() ) );

        auto result = client_->call( "eth_call", { jsonrpc::Value( request ), jsonrpc::Value( std::string( "latest" ) ) } );
        if ( !result )
        {
            logger_->warn( "eth_call {} on {} failed: {}", function, address_.toHexWithPrefix(),
                           result.error().message() );
            return ChainLinkError::CALL_FAILED;
        }
        auto output = bytesValue( result.value() );
        if ( !output )
        {
            return output.as_failure();
        }
        return abi_.decodeOutput( function, output.value() );
    }

    outcome::result<std::vector<uint8_t>> EvmContractHandle::encodeCall( const std::string              &function,
                                                                         const std::vector<eth::AbiValue> &args ) const
    {
        return abi_.encodeCall( function, args );
    }

    outcome::result<std::shared_ptr<LogFilter>> EvmContractHandle::createEventFilter( const std::string &event,
                                                                                      std::optional<uint64_t> from_block )
    {
        const auto *abi_event = abi_.findEvent( event );
        if ( abi_event == nullptr )
        {
            return eth::AbiError::UNKNOWN_EVENT;
        }

        jsonrpc::Value::Struct filter;
        filter["address"]   = jsonrpc::Value( address_.toHexWithPrefix() );
        filter["topics"]    = jsonrpc::Value( jsonrpc::Value::Array{ jsonrpc::Value( abi_event->topic().toHexWithPrefix() ) } );
        filter["fromBlock"] = jsonrpc::Value( from_block ? base::toQuantity( *from_block ) : std::string( "latest" ) );

        auto created = client_->call( "eth_newFilter", { jsonrpc::Value( filter ) } );
        if ( !created )
        {
            logger_->warn( "eth_newFilter for {} failed: {}", event, created.error().message() );
            return ChainLinkError::CALL_FAILED;
        }
        auto filter_id = stringValue( created.value() );
        if ( !filter_id )
        {
            return filter_id.as_failure();
        }
        logger_->info( "Filter {} installed for {} from {}", filter_id.value(), event,
                       from_block ? std::to_string( *from_block ) : std::string( "latest" ) );
        return std::make_shared<EvmLogFilter>( client_, filter_id.value(), abi_, *abi_event, from_block.has_value(),
                                               logger_ );
    }
} // namespace chainrelay::chain
