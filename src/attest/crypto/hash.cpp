#include <attest/crypto/hash.hpp>
#include <attest/memory.hpp>

#include <cstdint>

#include <sodium.h>

namespace attest::crypto {

namespace detail {

struct sha256
{
  crypto_hash_sha256_state state{};

  sha256()
  {
    crypto_hash_sha256_init( &state );
  }
};

} // namespace detail

// NOLINTBEGIN
thread_local static detail::sha256 sha256;

// NOLINTEND

digest hash( const void* ptr, std::size_t len )
{
  digest out;
  crypto_hash_sha256( memory::pointer_cast< unsigned char* >( out.data() ),
                      static_cast< const unsigned char* >( ptr ),
                      len );
  return out;
}

digest hash( std::span< const std::byte > s ) noexcept
{
  return hash( s.data(), s.size() );
}

digest hash( std::string_view sv ) noexcept
{
  return hash( sv.data(), sv.size() );
}

void hasher_reset() noexcept
{
  crypto_hash_sha256_init( &sha256.state );
}

void hasher_update( const void* ptr, std::size_t len ) noexcept
{
  crypto_hash_sha256_update( &sha256.state, static_cast< const unsigned char* >( ptr ), len );
}

void hasher_update( std::span< const std::byte > s ) noexcept
{
  hasher_update( s.data(), s.size() );
}

void hasher_update( std::string_view sv ) noexcept
{
  hasher_update( sv.data(), sv.size() );
}

void hasher_update( const digest& d ) noexcept
{
  hasher_update( d.data(), d.size() );
}

digest hasher_finalize() noexcept
{
  digest out;
  crypto_hash_sha256_final( &sha256.state, memory::pointer_cast< unsigned char* >( out.data() ) );
  crypto_hash_sha256_init( &sha256.state );
  return out;
}

} // namespace attest::crypto
