#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <attest/client/error.hpp>
#include <attest/client/ledger_service.hpp>
#include <attest/client/options.hpp>
#include <attest/protocol/types.hpp>
#include <attest/state/trust_cache.hpp>
#include <attest/store/tx.hpp>

namespace attest::client {

/**
 * An entry whose digest was recomputed and proven against the trusted state.
 *
 * For a reference the proven leaf is the reference itself (key, referenced
 * key and at_tx). The value returned alongside it is the referenced entry's
 * value as the server sent it and is not covered by the proof; read
 * referenced_key with verified_get to check it.
 */
struct verified_entry
{
  std::uint64_t tx = 0;
  store::bytes key;
  store::bytes value;
  std::int64_t timestamp = 0;
  std::optional< store::bytes > referenced_key;
  bool verified = false;
};

struct verified_tx
{
  store::tx tx;
  bool verified = false;
};

/**
 * Runs every data operation through proof verification before the result is
 * handed back, and moves the trusted state forward on success.
 *
 * A failed call never touches the trust cache. Calls may run concurrently from
 * several threads; use_database() must not race with them.
 */
class client final
{
public:
  client( std::shared_ptr< ledger_service > service,
          std::shared_ptr< state::trust_cache > cache,
          std::string server_identity,
          std::string database = std::string( default_database ) );

  client( const client& )            = delete;
  client( client&& )                 = delete;
  client& operator=( const client& ) = delete;
  client& operator=( client&& )      = delete;
  ~client()                          = default;

  // Builds the state store, cache and verifying key described by `opts`.
  static result< std::unique_ptr< client > > create( const options& opts, std::shared_ptr< ledger_service > service );

  result< verified_entry > verified_get( std::span< const std::byte > key );
  result< verified_entry > verified_get_at( std::span< const std::byte > key, std::uint64_t tx );
  result< verified_entry > verified_get_since( std::span< const std::byte > key, std::uint64_t tx );

  result< verified_tx > verified_set( std::span< const std::byte > key, std::span< const std::byte > value );

  // Stores `key` as a reference to `referenced_key`, resolved as of `at_tx` (0 = latest).
  result< verified_tx > verified_set_reference( std::span< const std::byte > referenced_key,
                                                std::span< const std::byte > key,
                                                std::uint64_t at_tx = 0 );

  result< verified_tx > verified_zadd( std::span< const std::byte > set,
                                       double score,
                                       std::span< const std::byte > key,
                                       std::uint64_t at_tx = 0 );

  result< verified_tx > verified_tx_by_id( std::uint64_t tx );

  // The trusted state, bootstrapped from the server when none is known yet.
  result< state::trust_state > current_state();

  void use_database( std::string database );
  const std::string& database() const noexcept;
  const std::string& server_identity() const noexcept;

  result< void > load_public_key( std::string_view pem );
  result< void > load_public_key_file( const std::filesystem::path& path );

  const std::shared_ptr< state::trust_cache >& cache() const noexcept;

private:
  state::state_key trust_key() const;

  result< verified_entry > get_entry( const protocol::key_request& request, std::string_view operation );

  std::shared_ptr< ledger_service > _service;
  std::shared_ptr< state::trust_cache > _cache;
  std::string _server_identity;
  std::string _database;
};

} // namespace attest::client
