#include "eth/rlp.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::eth::rlp, RlpError, e) {
  using E = chainrelay::eth::rlp::RlpError;
  switch (e) {
    case E::UNEXPECTED_END:
      return "RLP input ends inside an item";
    case E::NON_CANONICAL_SIZE:
      return "RLP size prefix is not canonical";
    case E::TRAILING_BYTES:
      return "RLP input has bytes after the top-level item";
    case E::UNEXPECTED_LIST:
      return "RLP list found where a string was expected";
    case E::UNEXPECTED_STRING:
      return "RLP string found where a list was expected";
  }
  return "Unknown RLP error";
}

namespace chainrelay::eth::rlp
{
    namespace
    {
        constexpr uint8_t kShortString = 0x80;
        constexpr uint8_t kLongString  = 0xb7;
        constexpr uint8_t kShortList   = 0xc0;
        constexpr uint8_t kLongList    = 0xf7;

        Bytes lengthBytes( size_t length )
        {
            Bytes out;
            while ( length > 0 )
            {
                out.insert( out.begin(), static_cast<uint8_t>( length & 0xff ) );
                length >>= 8;
            }
            return out;
        }

        Bytes header( size_t payload_size, uint8_t short_base, uint8_t long_base )
        {
            if ( payload_size <= 55 )
            {
                return { static_cast<uint8_t>( short_base + payload_size ) };
            }
            auto  len = lengthBytes( payload_size );
            Bytes out{ static_cast<uint8_t>( long_base + len.size() ) };
            out.insert( out.end(), len.begin(), len.end() );
            return out;
        }

        outcome::result<size_t> readLength( gsl::span<const uint8_t> input, size_t pos, size_t count )
        {
            if ( count == 0 || pos + count > static_cast<size_t>( input.size() ) || count > sizeof( size_t ) )
            {
                return RlpError::UNEXPECTED_END;
            }
            if ( input[pos] == 0 )
            {
                return RlpError::NON_CANONICAL_SIZE;
            }
            size_t length = 0;
            for ( size_t i = 0; i < count; ++i )
            {
                length = ( length << 8 ) | input[pos + i];
            }
            if ( length <= 55 )
            {
                return RlpError::NON_CANONICAL_SIZE;
            }
            return length;
        }

        outcome::result<Item> decodeAt( gsl::span<const uint8_t> input, size_t &pos )
        {
            if ( pos >= static_cast<size_t>( input.size() ) )
            {
                return RlpError::UNEXPECTED_END;
            }
            uint8_t prefix = input[pos++];
            Item    item;

            if ( prefix < kShortString )
            {
                item.bytes.push_back( prefix );
                return item;
            }

            size_t payload = 0;
            if ( prefix <= kLongString )
            {
                payload = prefix - kShortString;
            }
            else if ( prefix < kShortList )
            {
                size_t count  = prefix - kLongString;
                auto   length = readLength( input, pos, count );
                if ( !length )
                {
                    return length.as_failure();
                }
                pos += count;
                payload = length.value();
            }
            else
            {
                item.is_list = true;
                if ( prefix <= kLongList )
                {
                    payload = prefix - kShortList;
                }
                else
                {
                    size_t count  = prefix - kLongList;
                    auto   length = readLength( input, pos, count );
                    if ( !length )
                    {
                        return length.as_failure();
                    }
                    pos += count;
                    payload = length.value();
                }
            }

            if ( pos + payload > static_cast<size_t>( input.size() ) )
            {
                return RlpError::UNEXPECTED_END;
            }

            if ( !item.is_list )
            {
                if ( payload == 1 && input[pos] < kShortString )
                {
                    return RlpError::NON_CANONICAL_SIZE;
                }
                item.bytes.assign( input.begin() + pos, input.begin() + pos + payload );
                pos += payload;
                return item;
            }

            size_t end = pos + payload;
            while ( pos < end )
            {
                auto child = decodeAt( input.first( end ), pos );
                if ( !child )
                {
                    return child.as_failure();
                }
                item.items.push_back( std::move( child.value() ) );
            }
            return item;
        }
    } // namespace

    Bytes encodeBytes( gsl::span<const uint8_t> bytes )
    {
        if ( bytes.size() == 1 && bytes[0] < kShortString )
        {
            return { bytes[0] };
        }
        auto out = header( bytes.size(), kShortString, kLongString );
        out.insert( out.end(), bytes.begin(), bytes.end() );
        return out;
    }

    Bytes encodeInteger( const base::uint256_t &value )
    {
        return encodeBytes( base::toMinimalBigEndian( value ) );
    }

    Bytes encodeList( const std::vector<Bytes> &encoded_items )
    {
        size_t payload = 0;
        for ( const auto &item : encoded_items )
        {
            payload += item.size();
        }
        auto out = header( payload, kShortList, kLongList );
        for ( const auto &item : encoded_items )
        {
            out.insert( out.end(), item.begin(), item.end() );
        }
        return out;
    }

    outcome::result<base::uint256_t> Item::asInteger() const
    {
        if ( is_list )
        {
            return RlpError::UNEXPECTED_LIST;
        }
        if ( !bytes.empty() && bytes.front() == 0 )
        {
            return RlpError::NON_CANONICAL_SIZE;
        }
        return base::fromBigEndian( bytes );
    }

    outcome::result<Item> decode( gsl::span<const uint8_t> input )
    {
        size_t pos  = 0;
        auto   item = decodeAt( input, pos );
        if ( !item )
        {
            return item.as_failure();
        }
        if ( pos != static_cast<size_t>( input.size() ) )
        {
            return RlpError::TRAILING_BYTES;
        }
        return item;
    }
} // namespace chainrelay::eth::rlp
