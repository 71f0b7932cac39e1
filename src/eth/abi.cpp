#include "eth/abi.hpp"

#include <rapidjson/document.h>

#include "crypto/keccak/keccak.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::eth, AbiError, e) {
  using E = chainrelay::eth::AbiError;
  switch (e) {
    case E::INVALID_JSON:
      return "ABI is not a JSON array of entries";
    case E::UNKNOWN_FUNCTION:
      return "Function is not declared in the ABI";
    case E::UNKNOWN_EVENT:
      return "Event is not declared in the ABI";
    case E::ARGUMENT_COUNT_MISMATCH:
      return "Wrong number of arguments for the function";
    case E::TYPE_MISMATCH:
      return "Value does not match the declared ABI type";
    case E::UNSUPPORTED_TYPE:
      return "Only static ABI types are supported";
    case E::MALFORMED_DATA:
      return "ABI encoded data is malformed";
    case E::TOPIC_MISMATCH:
      return "Log topic does not belong to the event";
  }
  return "Unknown ABI error";
}

namespace chainrelay::eth
{
    namespace
    {
        constexpr size_t kWordSize = 32;

        std::optional<unsigned> typeWidth( std::string_view type, std::string_view prefix )
        {
            if ( type.substr( 0, prefix.size() ) != prefix )
            {
                return std::nullopt;
            }
            auto digits = type.substr( prefix.size() );
            if ( digits.empty() || digits.size() > 3 || digits.front() == '0' )
            {
                return std::nullopt;
            }
            unsigned width = 0;
            for ( char c : digits )
            {
                if ( c < '0' || c > '9' )
                {
                    return std::nullopt;
                }
                width = width * 10 + static_cast<unsigned>( c - '0' );
            }
            return width;
        }

        std::optional<unsigned> uintBits( std::string_view type )
        {
            auto bits = typeWidth( type, "uint" );
            if ( bits && *bits % 8 == 0 && *bits <= 256 )
            {
                return bits;
            }
            return std::nullopt;
        }

        std::optional<unsigned> fixedBytes( std::string_view type )
        {
            auto size = typeWidth( type, "bytes" );
            if ( size && *size <= 32 )
            {
                return size;
            }
            return std::nullopt;
        }

        bool fitsBits( const base::uint256_t &value, unsigned bits )
        {
            return bits >= 256 || ( value >> bits ) == 0;
        }

        std::string joinTypes( const std::vector<AbiParam> &params )
        {
            std::string out;
            for ( size_t i = 0; i < params.size(); ++i )
            {
                if ( i > 0 )
                {
                    out += ",";
                }
                out += params[i].type;
            }
            return out;
        }

        outcome::result<std::vector<AbiParam>> parseParams( const rapidjson::Value &entry, const char *key )
        {
            std::vector<AbiParam> params;
            if ( !entry.HasMember( key ) )
            {
                return params;
            }
            const auto &list = entry[key];
            if ( !list.IsArray() )
            {
                return AbiError::INVALID_JSON;
            }
            for ( const auto &item : list.GetArray() )
            {
                if ( !item.IsObject() || !item.HasMember( "type" ) || !item["type"].IsString() )
                {
                    return AbiError::INVALID_JSON;
                }
                AbiParam param;
                param.type = canonicalType( item["type"].GetString() );
                if ( item.HasMember( "name" ) && item["name"].IsString() )
                {
                    param.name = item["name"].GetString();
                }
                if ( item.HasMember( "indexed" ) && item["indexed"].IsBool() )
                {
                    param.indexed = item["indexed"].GetBool();
                }
                params.push_back( std::move( param ) );
            }
            return params;
        }

        base::Hash256 wordAt( gsl::span<const uint8_t> data, size_t index )
        {
            base::Hash256 word;
            std::copy( data.begin() + index * kWordSize, data.begin() + ( index + 1 ) * kWordSize, word.begin() );
            return word;
        }
    } // namespace

    std::string canonicalType( std::string_view type )
    {
        if ( type == "uint" )
        {
            return "uint256";
        }
        if ( type == "int" )
        {
            return "int256";
        }
        if ( type == "byte" )
        {
            return "bytes1";
        }
        return std::string( type );
    }

    bool isSupportedStaticType( std::string_view type )
    {
        return type == "address" || type == "bool" || uintBits( type ) || fixedBytes( type );
    }

    outcome::result<base::Hash256> encodeWord( std::string_view type, const AbiValue &value )
    {
        base::Hash256 word;
        if ( type == "address" )
        {
            const auto *address = std::get_if<Address>( &value );
            if ( address == nullptr )
            {
                return AbiError::TYPE_MISMATCH;
            }
            std::copy( address->begin(), address->end(), word.end() - Address::size() );
            return word;
        }
        if ( type == "bool" )
        {
            const auto *flag = std::get_if<bool>( &value );
            if ( flag == nullptr )
            {
                return AbiError::TYPE_MISMATCH;
            }
            word[kWordSize - 1] = *flag ? 1 : 0;
            return word;
        }
        if ( auto bits = uintBits( type ) )
        {
            const auto *number = std::get_if<base::uint256_t>( &value );
            if ( number == nullptr || !fitsBits( *number, *bits ) )
            {
                return AbiError::TYPE_MISMATCH;
            }
            return base::toBigEndianWord( *number );
        }
        if ( fixedBytes( type ) )
        {
            const auto *bytes = std::get_if<base::Hash256>( &value );
            if ( bytes == nullptr )
            {
                return AbiError::TYPE_MISMATCH;
            }
            return *bytes;
        }
        return AbiError::UNSUPPORTED_TYPE;
    }

    outcome::result<AbiValue> decodeWord( std::string_view type, const base::Hash256 &word )
    {
        if ( type == "address" )
        {
            if ( std::any_of( word.begin(), word.end() - Address::size(), []( uint8_t b ) { return b != 0; } ) )
            {
                return AbiError::MALFORMED_DATA;
            }
            Address address;
            std::copy( word.end() - Address::size(), word.end(), address.begin() );
            return AbiValue{ address };
        }
        if ( type == "bool" )
        {
            auto value = base::fromBigEndian( word );
            if ( !value || value.value() > 1 )
            {
                return AbiError::MALFORMED_DATA;
            }
            return AbiValue{ value.value() == 1 };
        }
        if ( auto bits = uintBits( type ) )
        {
            auto value = base::fromBigEndian( word );
            if ( !value || !fitsBits( value.value(), *bits ) )
            {
                return AbiError::MALFORMED_DATA;
            }
            return AbiValue{ value.value() };
        }
        if ( fixedBytes( type ) )
        {
            return AbiValue{ word };
        }
        return AbiError::UNSUPPORTED_TYPE;
    }

    std::string AbiFunction::signature() const
    {
        return name + "(" + joinTypes( inputs ) + ")";
    }

    Selector AbiFunction::selector() const
    {
        auto     hash = crypto::keccak256( std::string_view( signature() ) );
        Selector selector;
        std::copy( hash.begin(), hash.begin() + selector.size(), selector.begin() );
        return selector;
    }

    std::string AbiEvent::signature() const
    {
        return name + "(" + joinTypes( inputs ) + ")";
    }

    base::Hash256 AbiEvent::topic() const
    {
        return crypto::keccak256( std::string_view( signature() ) );
    }

    outcome::result<ContractAbi> ContractAbi::parse( std::string_view json )
    {
        rapidjson::Document document;
        document.Parse( json.data(), json.size() );
        if ( document.HasParseError() || !document.IsArray() )
        {
            return AbiError::INVALID_JSON;
        }

        ContractAbi abi;
        for ( const auto &entry : document.GetArray() )
        {
            if ( !entry.IsObject() )
            {
                return AbiError::INVALID_JSON;
            }
            std::string kind = "function";
            if ( entry.HasMember( "type" ) && entry["type"].IsString() )
            {
                kind = entry["type"].GetString();
            }
            if ( kind != "function" && kind != "event" )
            {
                continue;
            }
            if ( !entry.HasMember( "name" ) || !entry["name"].IsString() )
            {
                return AbiError::INVALID_JSON;
            }

            auto inputs = parseParams( entry, "inputs" );
            if ( !inputs )
            {
                return inputs.as_failure();
            }

            if ( kind == "event" )
            {
                AbiEvent event;
                event.name   = entry["name"].GetString();
                event.inputs = std::move( inputs.value() );
                if ( entry.HasMember( "anonymous" ) && entry["anonymous"].IsBool() )
                {
                    event.anonymous = entry["anonymous"].GetBool();
                }
                abi.events_.push_back( std::move( event ) );
                continue;
            }

            auto outputs = parseParams( entry, "outputs" );
            if ( !outputs )
            {
                return outputs.as_failure();
            }
            AbiFunction function;
            function.name    = entry["name"].GetString();
            function.inputs  = std::move( inputs.value() );
            function.outputs = std::move( outputs.value() );
            if ( entry.HasMember( "stateMutability" ) && entry["stateMutability"].IsString() )
            {
                function.state_mutability = entry["stateMutability"].GetString();
            }
            abi.functions_.push_back( std::move( function ) );
        }
        return abi;
    }

    const AbiFunction *ContractAbi::findFunction( std::string_view name ) const
    {
        for ( const auto &function : functions_ )
        {
            if ( function.name == name )
            {
                return &function;
            }
        }
        return nullptr;
    }

    const AbiEvent *ContractAbi::findEvent( std::string_view name ) const
    {
        for ( const auto &event : events_ )
        {
            if ( event.name == name )
            {
                return &event;
            }
        }
        return nullptr;
    }

    outcome::result<std::vector<uint8_t>> ContractAbi::encodeCall( std::string_view              function,
                                                                   const std::vector<AbiValue> &args ) const
    {
        const auto *fn = findFunction( function );
        if ( fn == nullptr )
        {
            return AbiError::UNKNOWN_FUNCTION;
        }
        if ( fn->inputs.size() != args.size() )
        {
            return AbiError::ARGUMENT_COUNT_MISMATCH;
        }

        auto                 selector = fn->selector();
        std::vector<uint8_t> out( selector.begin(), selector.end() );
        for ( size_t i = 0; i < args.size(); ++i )
        {
            auto word = encodeWord( fn->inputs[i].type, args[i] );
            if ( !word )
            {
                return word.as_failure();
            }
            out.insert( out.end(), word.value().begin(), word.value().end() );
        }
        return out;
    }

    outcome::result<std::vector<AbiValue>> ContractAbi::decodeOutput( std::string_view         function,
                                                                      gsl::span<const uint8_t> data ) const
    {
        const auto *fn = findFunction( function );
        if ( fn == nullptr )
        {
            return AbiError::UNKNOWN_FUNCTION;
        }
        if ( static_cast<size_t>( data.size() ) < fn->outputs.size() * kWordSize )
        {
            return AbiError::MALFORMED_DATA;
        }

        std::vector<AbiValue> values;
        for ( size_t i = 0; i < fn->outputs.size(); ++i )
        {
            auto value = decodeWord( fn->outputs[i].type, wordAt( data, i ) );
            if ( !value )
            {
                return value.as_failure();
            }
            values.push_back( value.value() );
        }
        return values;
    }

    outcome::result<std::map<std::string, AbiValue>> ContractAbi::decodeLog( const AbiEvent                   &event,
                                                                             const std::vector<base::Hash256> &topics,
                                                                             gsl::span<const uint8_t> data ) const
    {
        size_t topic_index = 0;
        if ( !event.anonymous )
        {
            if ( topics.empty() || topics.front() != event.topic() )
            {
                return AbiError::TOPIC_MISMATCH;
            }
            topic_index = 1;
        }

        std::map<std::string, AbiValue> values;
        size_t                          word_index = 0;
        size_t                          word_count = static_cast<size_t>( data.size() ) / kWordSize;
        for ( const auto &param : event.inputs )
        {
            std::optional<base::Hash256> word;
            if ( param.indexed )
            {
                if ( topic_index < topics.size() )
                {
                    word = topics[topic_index];
                }
                ++topic_index;
            }
            else
            {
                if ( word_index < word_count )
                {
                    word = wordAt( data, word_index );
                }
                ++word_index;
            }

            if ( !word || !isSupportedStaticType( param.type ) )
            {
                continue;
            }
            auto value = decodeWord( param.type, *word );
            if ( value )
            {
                values.emplace( param.name, value.value() );
            }
        }
        return values;
    }
} // namespace chainrelay::eth
