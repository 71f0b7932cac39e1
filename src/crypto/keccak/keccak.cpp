#include "crypto/keccak/keccak.hpp"

#include <nettle/sha3.h>

#include <cstring>

namespace chainrelay::crypto
{
    namespace
    {
        constexpr size_t kRate = 136;

        void absorbBlock( sha3_state &state, const uint8_t *block )
        {
            for ( size_t lane = 0; lane < kRate / 8; ++lane )
            {
                uint64_t value = 0;
                for ( size_t i = 0; i < 8; ++i )
                {
                    value |= static_cast<uint64_t>( block[lane * 8 + i] ) << ( 8 * i );
                }
                state.a[lane] ^= value;
            }
            sha3_permute( &state );
        }
    } // namespace

    base::Hash256 keccak256( std::string_view input )
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto *bytes_ptr = reinterpret_cast<const uint8_t *>( input.data() );
        return keccak256( gsl::make_span( bytes_ptr, input.length() ) );
    }

    base::Hash256 keccak256( gsl::span<const uint8_t> input )
    {
        sha3_state state;
        std::memset( &state, 0, sizeof( state ) );

        const uint8_t *data      = input.data();
        size_t         remaining = input.size();
        while ( remaining >= kRate )
        {
            absorbBlock( state, data );
            data += kRate;
            remaining -= kRate;
        }

        uint8_t last[kRate] = {};
        if ( remaining > 0 )
        {
            std::memcpy( last, data, remaining );
        }
        last[remaining] ^= 0x01;
        last[kRate - 1] ^= 0x80;
        absorbBlock( state, last );

        base::Hash256 out;
        for ( size_t i = 0; i < out.size(); ++i )
        {
            out[i] = static_cast<uint8_t>( state.a[i / 8] >> ( 8 * ( i % 8 ) ) );
        }
        return out;
    }
} // namespace chainrelay::crypto
