#include "eth/address.hpp"

#include <algorithm>
#include <cctype>

#include "crypto/keccak/keccak.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::eth, AddressError, e) {
  using E = chainrelay::eth::AddressError;
  switch (e) {
    case E::MISSING_0X_PREFIX:
      return "Address must start with 0x";
    case E::INVALID_LENGTH:
      return "Address must be 20 bytes (40 hex digits)";
    case E::NON_HEX_INPUT:
      return "Address contains non-hex characters";
    case E::BAD_CHECKSUM:
      return "Mixed-case address fails EIP-55 checksum";
  }
  return "Unknown address error";
}

namespace chainrelay::eth
{
    outcome::result<Address> parseAddress( std::string_view text )
    {
        if ( !base::hasHexPrefix( text ) )
        {
            return AddressError::MISSING_0X_PREFIX;
        }
        auto digits = text.substr( 2 );
        if ( digits.size() != Address::size() * 2 )
        {
            return AddressError::INVALID_LENGTH;
        }
        if ( !std::all_of( digits.begin(), digits.end(), []( char c ) { return std::isxdigit( c ) != 0; } ) )
        {
            return AddressError::NON_HEX_INPUT;
        }

        auto address = Address::fromHex( digits );
        if ( !address )
        {
            return AddressError::NON_HEX_INPUT;
        }

        bool has_lower = std::any_of( digits.begin(), digits.end(), []( char c ) { return std::islower( c ) != 0; } );
        bool has_upper = std::any_of( digits.begin(), digits.end(), []( char c ) { return std::isupper( c ) != 0; } );
        if ( has_lower && has_upper && toChecksumAddress( address.value() ).substr( 2 ) != digits )
        {
            return AddressError::BAD_CHECKSUM;
        }
        return address.value();
    }

    std::string toChecksumAddress( const Address &address )
    {
        auto lower = address.toHex();
        auto hash  = crypto::keccak256( std::string_view( lower ) );

        std::string out = "0x";
        for ( size_t i = 0; i < lower.size(); ++i )
        {
            uint8_t nibble = ( i % 2 == 0 ) ? ( hash[i / 2] >> 4 ) : ( hash[i / 2] & 0x0f );
            char    c      = lower[i];
            out.push_back( ( nibble >= 8 && std::isalpha( c ) ) ? static_cast<char>( std::toupper( c ) ) : c );
        }
        return out;
    }

    Address addressFromPublicKey( const crypto::secp256k1::UncompressedPublicKey &public_key )
    {
        auto    hash = crypto::keccak256( gsl::make_span( public_key.data() + 1, public_key.size() - 1 ) );
        Address address;
        std::copy( hash.end() - Address::size(), hash.end(), address.begin() );
        return address;
    }
} // namespace chainrelay::eth
