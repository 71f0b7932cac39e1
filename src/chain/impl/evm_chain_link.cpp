#include "chain/impl/evm_chain_link.hpp"

#include <limits>

#include <boost/algorithm/string/predicate.hpp>

#include "base/hexutil.hpp"
#include "chain/block_header.hpp"
#include "chain/impl/evm_contract_handle.hpp"
#include "chain/impl/rpc_values.hpp"

namespace chainrelay::chain
{
    EvmChainLink::EvmChainLink( std::shared_ptr<api::HttpClient> http, std::string rpc_url, uint64_t chain_id,
                                std::chrono::milliseconds rpc_timeout ) :
        http_( std::move( http ) ),
        rpc_url_( std::move( rpc_url ) ),
        chain_id_( chain_id ),
        rpc_timeout_( rpc_timeout ),
        logger_( base::createLogger( "ChainLink-" + std::to_string( chain_id ) ) )
    {
    }

    outcome::result<void> EvmChainLink::connect()
    {
        connected_ = false;
        client_    = std::make_shared<api::JsonRpcClient>( http_, rpc_url_, rpc_timeout_ );

        auto session = establishSession();
        if ( !session )
        {
            logger_->error( "Connection to chain {} failed: {}", chain_id_, session.error().message() );
            if ( session.error() == ChainLinkError::CHAIN_ID_MISMATCH )
            {
                return session;
            }
            return ChainLinkError::CONNECTION_FAILED;
        }
        connected_ = true;
        logger_->info( "Connected to chain {}", chain_id_ );
        return outcome::success();
    }

    outcome::result<void> EvmChainLink::establishSession()
    {
        auto chain_id = client_->call( "eth_chainId", {} );
        if ( !chain_id )
        {
            return chain_id.as_failure();
        }
        auto reported = uint64Value( chain_id.value() );
        if ( !reported )
        {
            return reported.as_failure();
        }
        if ( reported.value() != chain_id_ )
        {
            logger_->error( "Node at chain {} reports chain id {}", chain_id_, reported.value() );
            return ChainLinkError::CHAIN_ID_MISMATCH;
        }

        // first live call goes through the PoA tolerant header reader
        auto block = client_->call( "eth_getBlockByNumber",
                                    { jsonrpc::Value( std::string( "latest" ) ), jsonrpc::Value( false ) } );
        if ( !block )
        {
            return block.as_failure();
        }
        auto header = parseBlockHeader( block.value() );
        if ( !header )
        {
            return header.as_failure();
        }
        logger_->debug( "Chain {} head {} ({} bytes extra data)", chain_id_, header.value().number,
                        header.value().extra_data.size() );
        return outcome::success();
    }

    bool EvmChainLink::isConnected()
    {
        if ( !connected_ )
        {
            return false;
        }
        auto ping = client_->call( "eth_blockNumber", {} );
        if ( !ping )
        {
            logger_->warn( "Liveness check failed: {}", ping.error().message() );
            connected_ = false;
        }
        return connected_;
    }

    int64_t EvmChainLink::latestBlock()
    {
        if ( !connected_ )
        {
            return -1;
        }
        auto head = client_->call( "eth_blockNumber", {} );
        if ( !head )
        {
            logger_->warn( "eth_blockNumber failed: {}", head.error().message() );
            connected_ = false;
            return -1;
        }
        auto number = uint64Value( head.value() );
        if ( !number || number.value() > static_cast<uint64_t>( std::numeric_limits<int64_t>::max() ) )
        {
            logger_->warn( "eth_blockNumber returned a malformed quantity" );
            return -1;
        }
        return static_cast<int64_t>( number.value() );
    }

    outcome::result<std::shared_ptr<ContractHandle>> EvmChainLink::bindContract( const eth::Address     &address,
                                                                                 const eth::ContractAbi &abi )
    {
        if ( !connected_ )
        {
            return ChainLinkError::NOT_CONNECTED;
        }
        return std::make_shared<EvmContractHandle>( client_, address, abi, logger_ );
    }

    outcome::result<base::uint256_t> EvmChainLink::gasPrice()
    {
        if ( !connected_ )
        {
            return ChainLinkError::NOT_CONNECTED;
        }
        auto price = client_->call( "eth_gasPrice", {} );
        if ( !price )
        {
            return ChainLinkError::CALL_FAILED;
        }
        return quantityValue( price.value() );
    }

    outcome::result<base::uint256_t> EvmChainLink::transactionCount( const eth::Address &account )
    {
        if ( !connected_ )
        {
            return ChainLinkError::NOT_CONNECTED;
        }
        auto count = client_->call( "eth_getTransactionCount",
                                    { jsonrpc::Value( account.toHexWithPrefix() ),
                                      jsonrpc::Value( std::string( "pending" ) ) } );
        if ( !count )
        {
            return ChainLinkError::CALL_FAILED;
        }
        return quantityValue( count.value() );
    }

    outcome::result<base::Hash256> EvmChainLink::sendRawTransaction( const std::vector<uint8_t> &raw_transaction )
    {
        if ( !connected_ )
        {
            return ChainLinkError::NOT_CONNECTED;
        }
        auto sent =
            client_->call( "eth_sendRawTransaction", { jsonrpc::Value( base::hex_lower_0x( raw_transaction ) ) } );
        if ( sent )
        {
            return hashValue( sent.value() );
        }
        if ( sent.error() != api::JsonRpcError::NODE_ERROR )
        {
            logger_->warn( "eth_sendRawTransaction did not reach the node: {}", sent.error().message() );
            connected_ = false;
            return ChainLinkError::CALL_FAILED;
        }

        const auto &message = client_->lastFault()->message;
        if ( boost::algorithm::icontains( message, "nonce too low" ) )
        {
            return ChainLinkError::NONCE_TOO_LOW;
        }
        if ( boost::algorithm::icontains( message, "insufficient funds" ) )
        {
            return ChainLinkError::INSUFFICIENT_FUNDS;
        }
        return ChainLinkError::TRANSACTION_REJECTED;
    }

    std::optional<std::string> EvmChainLink::lastNodeError() const
    {
        if ( !client_ || !client_->lastFault() )
        {
            return std::nullopt;
        }
        return client_->lastFault()->message;
    }
} // namespace chainrelay::chain
