#include <attest/state/trust_cache.hpp>

#include <utility>

#include <attest/log.hpp>

namespace attest::state {

trust_cache::trust_cache():
    trust_cache( std::make_shared< memory_state_store >() )
{}

trust_cache::trust_cache( std::shared_ptr< state_store > store ):
    _store( std::move( store ) )
{}

void trust_cache::set_verifying_key( std::optional< crypto::public_key > key )
{
  std::lock_guard< std::mutex > lock( _mutex );
  _verifying_key = std::move( key );
}

std::optional< crypto::public_key > trust_cache::verifying_key() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _verifying_key;
}

result< std::optional< trust_state > > trust_cache::get( const state_key& key ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _store->load( key );
}

result< void > trust_cache::check( const state_key& key, const trust_state& s ) const
{
  if( s.database != key.database )
    return std::unexpected( state_errc::database_mismatch );

  if( !_verifying_key )
    return {};

  if( s.signature.empty() )
    return std::unexpected( state_errc::signature_missing );

  if( !check_signature( s, *_verifying_key ) )
    return std::unexpected( state_errc::signature_invalid );

  return {};
}

result< bool > trust_cache::set( const state_key& key, const trust_state& s )
{
  std::lock_guard< std::mutex > lock( _mutex );

  if( auto checked = check( key, s ); !checked )
  {
    LOG_ERROR( attest::log::instance(),
               "Rejected state {}:{} at tx {}: {}",
               key.server,
               key.database,
               s.tx_id,
               checked.error().message() );
    return std::unexpected( checked.error() );
  }

  auto current = _store->load( key );
  if( !current )
    return std::unexpected( current.error() );

  if( *current && s.tx_id <= ( *current )->tx_id )
  {
    LOG_DEBUG( attest::log::instance(),
               "Ignoring stale state {}:{} at tx {}, already trusting tx {}",
               key.server,
               key.database,
               s.tx_id,
               ( *current )->tx_id );
    return false;
  }

  if( auto saved = _store->save( key, s ); !saved )
    return std::unexpected( saved.error() );

  LOG_DEBUG( attest::log::instance(),
             "Trusting {}:{} at tx {} ({})",
             key.server,
             key.database,
             s.tx_id,
             attest::log::hex{ s.tx_hash.data(), s.tx_hash.size() } );

  return true;
}

result< void > trust_cache::reset( const state_key& key )
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _store->remove( key );
}

} // namespace attest::state
