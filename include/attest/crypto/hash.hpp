#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

#include <boost/endian/conversion.hpp>

namespace attest::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

// Streaming SHA-256 over a thread local state. Integers are fed big endian.
void hasher_reset() noexcept;
digest hasher_finalize() noexcept;
void hasher_update( const void* ptr, std::size_t len ) noexcept;
void hasher_update( std::span< const std::byte > s ) noexcept;
void hasher_update( std::string_view sv ) noexcept;
void hasher_update( const digest& d ) noexcept;

template< typename T >
  requires std::is_integral_v< T >
void hasher_update( T t ) noexcept
{
  t = boost::endian::native_to_big( t );
  hasher_update( &t, sizeof( T ) );
}

digest hash( const void* ptr, std::size_t len );
digest hash( std::span< const std::byte > s ) noexcept;
digest hash( std::string_view sv ) noexcept;

template< typename T >
  requires std::is_integral_v< T >
digest hash( T t ) noexcept
{
  t = boost::endian::native_to_big( t );
  return hash( &t, sizeof( T ) );
}

} // namespace attest::crypto
