#include <attest/state/trust_state.hpp>

#include <span>

#include <boost/endian/conversion.hpp>

#include <attest/memory.hpp>

namespace attest::state {

std::vector< std::byte > signing_bytes( const trust_state& s )
{
  std::vector< std::byte > out;
  out.reserve( sizeof( std::uint32_t ) + s.database.size() + sizeof( std::uint64_t ) + s.tx_hash.size() );

  auto database_len = boost::endian::native_to_big( static_cast< std::uint32_t >( s.database.size() ) );
  auto len_bytes    = std::as_bytes( std::span( &database_len, 1 ) );
  out.insert( out.end(), len_bytes.begin(), len_bytes.end() );

  auto database_bytes = memory::as_bytes( s.database );
  out.insert( out.end(), database_bytes.begin(), database_bytes.end() );

  auto tx_id       = boost::endian::native_to_big( s.tx_id );
  auto tx_id_bytes = std::as_bytes( std::span( &tx_id, 1 ) );
  out.insert( out.end(), tx_id_bytes.begin(), tx_id_bytes.end() );

  out.insert( out.end(), s.tx_hash.begin(), s.tx_hash.end() );

  return out;
}

bool check_signature( const trust_state& s, const crypto::public_key& key )
{
  if( s.signature.empty() )
    return false;

  return key.verify( s.signature, signing_bytes( s ) );
}

} // namespace attest::state
