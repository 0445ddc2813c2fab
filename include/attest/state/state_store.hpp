#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include <attest/state/error.hpp>
#include <attest/state/trust_state.hpp>

namespace attest::state {

/**
 * Backing storage for trust states, keyed by (server, database).
 *
 * Implementations need not be thread safe: trust_cache serialises every call.
 */
class state_store
{
public:
  state_store()                                = default;
  state_store( const state_store& )            = delete;
  state_store( state_store&& )                 = delete;
  state_store& operator=( const state_store& ) = delete;
  state_store& operator=( state_store&& )      = delete;
  virtual ~state_store()                       = default;

  virtual result< std::optional< trust_state > > load( const state_key& key ) = 0;
  virtual result< void > save( const state_key& key, const trust_state& s )   = 0;
  virtual result< void > remove( const state_key& key )                       = 0;
  virtual result< std::vector< std::pair< state_key, trust_state > > > list() = 0;
};

class memory_state_store final: public state_store
{
public:
  result< std::optional< trust_state > > load( const state_key& key ) override;
  result< void > save( const state_key& key, const trust_state& s ) override;
  result< void > remove( const state_key& key ) override;
  result< std::vector< std::pair< state_key, trust_state > > > list() override;

private:
  std::map< state_key, trust_state > _states;
};

/**
 * One file per (server, database) under a directory, so trust survives a
 * process restart. Files are replaced atomically.
 */
class file_state_store final: public state_store
{
public:
  explicit file_state_store( std::filesystem::path directory );

  result< std::optional< trust_state > > load( const state_key& key ) override;
  result< void > save( const state_key& key, const trust_state& s ) override;
  result< void > remove( const state_key& key ) override;
  result< std::vector< std::pair< state_key, trust_state > > > list() override;

  const std::filesystem::path& directory() const noexcept;
  std::filesystem::path path_for( const state_key& key ) const;

private:
  std::filesystem::path _directory;
};

} // namespace attest::state
