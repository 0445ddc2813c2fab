#include <attest/state/state_store.hpp>

namespace attest::state {

result< std::optional< trust_state > > memory_state_store::load( const state_key& key )
{
  if( auto itr = _states.find( key ); itr != _states.end() )
    return itr->second;

  return std::optional< trust_state >{};
}

result< void > memory_state_store::save( const state_key& key, const trust_state& s )
{
  _states.insert_or_assign( key, s );
  return {};
}

result< void > memory_state_store::remove( const state_key& key )
{
  _states.erase( key );
  return {};
}

result< std::vector< std::pair< state_key, trust_state > > > memory_state_store::list()
{
  return std::vector< std::pair< state_key, trust_state > >( _states.begin(), _states.end() );
}

} // namespace attest::state
