#include <attest/crypto/public_key.hpp>
#include <attest/memory.hpp>

#include <fstream>
#include <iterator>
#include <limits>
#include <string>
#include <utility>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <sodium.h>

namespace attest::crypto {

result< void > initialize() noexcept
{
  static const int retval = sodium_init();

  if( retval < 0 )
    return std::unexpected( crypto_errc::initialization_failed );

  return {};
}

public_key::public_key( std::shared_ptr< evp_pkey_st > key ) noexcept:
    _key( std::move( key ) )
{}

bool public_key::operator==( const public_key& rhs ) const noexcept
{
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
  return EVP_PKEY_eq( _key.get(), rhs._key.get() ) == 1;
#else
  return EVP_PKEY_cmp( _key.get(), rhs._key.get() ) == 1;
#endif
}

bool public_key::operator!=( const public_key& rhs ) const noexcept
{
  return !( *this == rhs );
}

result< public_key > public_key::from_pem( std::string_view pem ) noexcept
{
  if( pem.empty() || pem.size() > static_cast< std::size_t >( std::numeric_limits< int >::max() ) )
    return std::unexpected( crypto_errc::invalid_public_key );

  std::unique_ptr< BIO, decltype( &BIO_free ) > bio( BIO_new_mem_buf( pem.data(), static_cast< int >( pem.size() ) ),
                                                     BIO_free );
  if( !bio )
    return std::unexpected( crypto_errc::invalid_public_key );

  std::shared_ptr< EVP_PKEY > key( PEM_read_bio_PUBKEY( bio.get(), nullptr, nullptr, nullptr ), EVP_PKEY_free );
  if( !key )
    return std::unexpected( crypto_errc::invalid_public_key );

  auto type = EVP_PKEY_base_id( key.get() );
  if( type != EVP_PKEY_EC && type != EVP_PKEY_ED25519 )
    return std::unexpected( crypto_errc::unsupported_key_type );

  return public_key( std::move( key ) );
}

result< public_key > public_key::from_pem_file( const std::filesystem::path& path )
{
  std::ifstream file( path, std::ios::binary );
  if( !file )
    return std::unexpected( crypto_errc::unreadable_key_file );

  std::string pem{ std::istreambuf_iterator< char >( file ), std::istreambuf_iterator< char >() };
  if( file.bad() )
    return std::unexpected( crypto_errc::unreadable_key_file );

  return from_pem( pem );
}

bool public_key::verify( std::span< const std::byte > signature, std::span< const std::byte > message ) const noexcept
{
  if( signature.empty() )
    return false;

  std::unique_ptr< EVP_MD_CTX, decltype( &EVP_MD_CTX_free ) > ctx( EVP_MD_CTX_new(), EVP_MD_CTX_free );
  if( !ctx )
    return false;

  const EVP_MD* md = EVP_PKEY_base_id( _key.get() ) == EVP_PKEY_ED25519 ? nullptr : EVP_sha256();

  if( EVP_DigestVerifyInit( ctx.get(), nullptr, md, nullptr, _key.get() ) != 1 )
    return false;

  return EVP_DigestVerify( ctx.get(),
                           memory::pointer_cast< const unsigned char* >( signature.data() ),
                           signature.size(),
                           memory::pointer_cast< const unsigned char* >( message.data() ),
                           message.size() )
         == 1;
}

} // namespace attest::crypto
