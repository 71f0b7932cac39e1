#include "eth/transaction.hpp"

#include <algorithm>

#include "crypto/keccak/keccak.hpp"
#include "eth/rlp.hpp"

namespace chainrelay::eth
{
    namespace
    {
        std::vector<rlp::Bytes> commonFields( const LegacyTransaction &tx )
        {
            return { rlp::encodeInteger( tx.nonce ),     rlp::encodeInteger( tx.gas_price ),
                     rlp::encodeInteger( tx.gas_limit ), rlp::encodeBytes( tx.to ),
                     rlp::encodeInteger( tx.value ),     rlp::encodeBytes( tx.data ) };
        }

        /// r and s are integers in RLP, leading zero bytes are dropped
        rlp::Bytes encodeScalar( const base::Blob<crypto::secp256k1::constants::kScalarSize> &scalar )
        {
            auto it     = std::find_if( scalar.begin(), scalar.end(), []( uint8_t b ) { return b != 0; } );
            auto offset = std::distance( scalar.begin(), it );
            return rlp::encodeBytes(
                gsl::span<const uint8_t>( scalar.data() + offset, static_cast<std::ptrdiff_t>( scalar.size() ) - offset ) );
        }
    } // namespace

    base::Hash256 LegacyTransaction::signingHash() const
    {
        auto fields = commonFields( *this );
        fields.push_back( rlp::encodeInteger( chain_id ) );
        fields.push_back( rlp::encodeInteger( 0 ) );
        fields.push_back( rlp::encodeInteger( 0 ) );
        return crypto::keccak256( rlp::encodeList( fields ) );
    }

    std::vector<uint8_t> LegacyTransaction::encodeSigned( const crypto::secp256k1::RecoverableSignature &signature ) const
    {
        base::uint256_t v = base::uint256_t( signature.recovery_id ) + 35 + base::uint256_t( chain_id ) * 2;

        auto fields = commonFields( *this );
        fields.push_back( rlp::encodeInteger( v ) );
        fields.push_back( encodeScalar( signature.r ) );
        fields.push_back( encodeScalar( signature.s ) );
        return rlp::encodeList( fields );
    }

    base::Hash256 transactionHash( const std::vector<uint8_t> &raw_transaction )
    {
        return crypto::keccak256( raw_transaction );
    }
} // namespace chainrelay::eth
