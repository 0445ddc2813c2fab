#include <attest/store/entry.hpp>

#include <algorithm>
#include <bit>
#include <iterator>
#include <type_traits>
#include <utility>

#include <boost/endian/conversion.hpp>

namespace attest::store {

namespace {

template< typename T >
  requires std::is_integral_v< T >
void append_big( bytes& out, T value )
{
  boost::endian::native_to_big_inplace( value );
  auto view = std::as_bytes( std::span( &value, 1 ) );
  out.insert( out.end(), view.begin(), view.end() );
}

void append( bytes& out, std::span< const std::byte > data )
{
  out.insert( out.end(), data.begin(), data.end() );
}

bytes wrap_with_prefix( std::span< const std::byte > data, std::byte prefix )
{
  bytes out;
  out.reserve( data.size() + 1 );
  out.push_back( prefix );
  append( out, data );
  return out;
}

} // namespace

bytes encoded_kv::encode() const
{
  bytes out;
  out.reserve( key.size() + crypto::digest_length );
  append( out, key );
  append( out, value_hash() );
  return out;
}

crypto::digest encoded_kv::value_hash() const noexcept
{
  return crypto::hash( std::span< const std::byte >( value ) );
}

crypto::digest encoded_kv::digest() const noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( std::span< const std::byte >( key ) );
  crypto::hasher_update( value_hash() );
  return crypto::hasher_finalize();
}

bytes encode_key( std::span< const std::byte > key )
{
  return wrap_with_prefix( key, set_key_prefix );
}

encoded_kv encode_plain( std::span< const std::byte > key, std::span< const std::byte > value )
{
  return encoded_kv{ .key = encode_key( key ), .value = wrap_with_prefix( value, plain_value_prefix ) };
}

encoded_kv
encode_reference( std::span< const std::byte > key, std::span< const std::byte > referenced_key, std::uint64_t at_tx )
{
  bytes reference;
  reference.reserve( 1 + sizeof( at_tx ) + 1 + referenced_key.size() );
  reference.push_back( reference_value_prefix );
  append_big( reference, at_tx );
  append( reference, encode_key( referenced_key ) );

  return encoded_kv{ .key = encode_key( key ), .value = std::move( reference ) };
}

encoded_kv
encode_zadd( std::span< const std::byte > set, double score, std::span< const std::byte > key, std::uint64_t at_tx )
{
  auto ekey = encode_key( key );

  bytes zkey;
  zkey.reserve( 1 + sizeof( std::uint64_t ) * 4 + set.size() + ekey.size() );
  zkey.push_back( sorted_key_prefix );
  append_big( zkey, static_cast< std::uint64_t >( set.size() ) );
  append( zkey, set );
  append_big( zkey, std::bit_cast< std::uint64_t >( score ) );
  append_big( zkey, static_cast< std::uint64_t >( ekey.size() ) );
  append( zkey, ekey );
  append_big( zkey, at_tx );

  return encoded_kv{ .key = std::move( zkey ), .value = {} };
}

encoded_kv plain_entry::encode() const
{
  return encode_plain( key, value );
}

encoded_kv reference_entry::encode() const
{
  return encode_reference( key, referenced_key, at_tx );
}

encoded_kv sorted_set_entry::encode() const
{
  return encode_zadd( set, score, key, at_tx );
}

encoded_kv encode( const entry& e )
{
  return std::visit(
    []( const auto& alternative )
    {
      return alternative.encode();
    },
    e );
}

crypto::digest entry_digest( const entry& e )
{
  return encode( e ).digest();
}

} // namespace attest::store
