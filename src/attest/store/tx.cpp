#include <attest/store/tx.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

#include <attest/crypto/merkle_tree.hpp>

namespace attest::store {

crypto::digest tx_metadata::inner_hash() const noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( static_cast< std::uint64_t >( ts ) );
  crypto::hasher_update( nentries );
  crypto::hasher_update( eh );
  crypto::hasher_update( bl_tx_id );
  crypto::hasher_update( bl_root );
  return crypto::hasher_finalize();
}

crypto::digest tx_metadata::alh() const noexcept
{
  auto inner = inner_hash();

  crypto::hasher_reset();
  crypto::hasher_update( id );
  crypto::hasher_update( prev_alh );
  crypto::hasher_update( inner );
  return crypto::hasher_finalize();
}

crypto::digest tx_entry::digest() const noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( std::span< const std::byte >( key ) );
  crypto::hasher_update( value_hash );
  return crypto::hasher_finalize();
}

tx_entry make_tx_entry( const encoded_kv& kv )
{
  return tx_entry{ .key = kv.key, .value_hash = kv.value_hash() };
}

namespace {

crypto::merkle_tree entries_tree( const std::vector< tx_entry >& entries )
{
  std::vector< crypto::digest > digests;
  digests.reserve( entries.size() );

  for( const auto& entry: entries )
    digests.emplace_back( entry.digest() );

  return crypto::merkle_tree( digests );
}

} // namespace

crypto::digest tx::entries_root() const
{
  return entries_tree( entries ).root();
}

result< inclusion_proof > tx::proof( std::span< const std::byte > key ) const
{
  auto itr = std::ranges::find_if( entries,
                                   [ & ]( const tx_entry& entry )
                                   {
                                     return std::ranges::equal( entry.key, key );
                                   } );

  if( itr == entries.end() )
    return std::unexpected( store_errc::entry_not_found );

  auto index = static_cast< std::uint64_t >( std::distance( entries.begin(), itr ) );
  auto terms = entries_tree( entries ).inclusion_proof( index );

  if( !terms )
    return std::unexpected( store_errc::malformed_proof );

  return inclusion_proof{ .leaf = index, .width = entries.size(), .terms = std::move( *terms ) };
}

} // namespace attest::store
