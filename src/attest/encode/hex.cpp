#include <attest/encode/hex.hpp>

#include <bit>
#include <cstdint>

namespace attest::encode {

namespace {

constexpr char hex_offset    = 10;
constexpr auto hex_digits    = std::string_view( "0123456789abcdef" );
constexpr auto nibble_mask   = 0x0f;
constexpr auto nibble_length = 4;

result< std::uint8_t > hex_to_nibble( char in ) noexcept
{
  if( in >= '0' && in <= '9' )
    return in - '0';
  if( in >= 'a' && in <= 'f' )
    return in - 'a' + hex_offset;
  if( in >= 'A' && in <= 'F' )
    return in - 'A' + hex_offset;

  return std::unexpected( encode_errc::invalid_character );
}

} // namespace

std::string to_hex( std::span< const std::byte > s, hex_prefix prefix ) noexcept
{
  std::string out;
  out.reserve( s.size() * 2 + 2 );

  if( prefix == hex_prefix::with_0x )
    out.append( "0x" );

  for( const auto& b: s )
  {
    auto c = std::bit_cast< std::uint8_t >( b );
    out.push_back( hex_digits[ c >> nibble_length ] );
    out.push_back( hex_digits[ c & nibble_mask ] );
  }

  return out;
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( 2 );
  else if( sv.starts_with( "x" ) || sv.starts_with( "X" ) )
    return std::unexpected( encode_errc::invalid_prefix );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::invalid_length );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  for( std::size_t i = 0; i < sv.size(); i += 2 )
  {
    auto high = hex_to_nibble( sv[ i ] );
    if( !high )
      return std::unexpected( high.error() );

    auto low = hex_to_nibble( sv[ i + 1 ] );
    if( !low )
      return std::unexpected( low.error() );

    bytes.push_back( static_cast< std::byte >( *high << nibble_length | *low ) );
  }

  return bytes;
}

} // namespace attest::encode
