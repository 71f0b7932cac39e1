#include "crypto/secp256k1/impl/secp256k1_provider_impl.hpp"

#include <algorithm>
#include <stdexcept>

#include <secp256k1_recovery.h>

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::crypto, Secp256k1ProviderError, e) {
  using E = chainrelay::crypto::Secp256k1ProviderError;
  switch (e) {
    case E::INVALID_PRIVATE_KEY:
      return "Private key is zero or not below the curve order";
    case E::INVALID_SIGNATURE:
      return "Signature scalars are out of range";
    case E::SIGNING_FAILED:
      return "ECDSA signing failed";
    case E::RECOVERY_FAILED:
      return "Public key recovery failed";
    case E::INTERNAL_ERROR:
      return "Internal secp256k1 error";
  }
  return "Unknown secp256k1 error";
}

namespace chainrelay::crypto
{
    using secp256k1::MessageHash;
    using secp256k1::RecoverableSignature;
    using secp256k1::UncompressedPublicKey;

    Secp256k1ProviderImpl::Secp256k1ProviderImpl() :
        context_( secp256k1_context_create( SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY ) )
    {
        if ( !context_ )
        {
            throw std::runtime_error( "secp256k1 context could not be created" );
        }
    }

    outcome::result<UncompressedPublicKey> Secp256k1ProviderImpl::serialize( const secp256k1_pubkey &public_key ) const
    {
        UncompressedPublicKey out;
        size_t                size = out.size();
        if ( secp256k1_ec_pubkey_serialize( context_.get(), out.data(), &size, &public_key,
                                            SECP256K1_EC_UNCOMPRESSED ) != 1 ||
             size != out.size() )
        {
            return Secp256k1ProviderError::INTERNAL_ERROR;
        }
        return out;
    }

    outcome::result<UncompressedPublicKey> Secp256k1ProviderImpl::derivePublicKey( const SecretKey &key ) const
    {
        if ( secp256k1_ec_seckey_verify( context_.get(), key.bytes().data() ) != 1 )
        {
            return Secp256k1ProviderError::INVALID_PRIVATE_KEY;
        }

        secp256k1_pubkey public_key;
        if ( secp256k1_ec_pubkey_create( context_.get(), &public_key, key.bytes().data() ) != 1 )
        {
            return Secp256k1ProviderError::INTERNAL_ERROR;
        }
        return serialize( public_key );
    }

    outcome::result<RecoverableSignature> Secp256k1ProviderImpl::sign( const MessageHash &hash,
                                                                       const SecretKey   &key ) const
    {
        if ( secp256k1_ec_seckey_verify( context_.get(), key.bytes().data() ) != 1 )
        {
            return Secp256k1ProviderError::INVALID_PRIVATE_KEY;
        }

        secp256k1_ecdsa_recoverable_signature raw;
        if ( secp256k1_ecdsa_sign_recoverable( context_.get(), &raw, hash.data(), key.bytes().data(),
                                               secp256k1_nonce_function_rfc6979, nullptr ) != 1 )
        {
            return Secp256k1ProviderError::SIGNING_FAILED;
        }

        // libsecp256k1 only produces low-s signatures
        uint8_t compact[64];
        int     recovery_id = 0;
        if ( secp256k1_ecdsa_recoverable_signature_serialize_compact( context_.get(), compact, &recovery_id, &raw ) !=
             1 )
        {
            return Secp256k1ProviderError::INTERNAL_ERROR;
        }

        RecoverableSignature signature;
        std::copy( compact, compact + 32, signature.r.begin() );
        std::copy( compact + 32, compact + 64, signature.s.begin() );
        signature.recovery_id = static_cast<uint8_t>( recovery_id );
        return signature;
    }

    outcome::result<UncompressedPublicKey> Secp256k1ProviderImpl::recoverPublicKey(
        const MessageHash &hash, const RecoverableSignature &signature ) const
    {
        if ( signature.recovery_id > 3 )
        {
            return Secp256k1ProviderError::INVALID_SIGNATURE;
        }

        uint8_t compact[64];
        std::copy( signature.r.begin(), signature.r.end(), compact );
        std::copy( signature.s.begin(), signature.s.end(), compact + 32 );

        secp256k1_ecdsa_recoverable_signature raw;
        if ( secp256k1_ecdsa_recoverable_signature_parse_compact( context_.get(), &raw, compact,
                                                                  signature.recovery_id ) != 1 )
        {
            return Secp256k1ProviderError::INVALID_SIGNATURE;
        }

        secp256k1_pubkey public_key;
        if ( secp256k1_ecdsa_recover( context_.get(), &public_key, &raw, hash.data() ) != 1 )
        {
            return Secp256k1ProviderError::RECOVERY_FAILED;
        }
        return serialize( public_key );
    }
} // namespace chainrelay::crypto
