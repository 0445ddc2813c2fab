#include <attest/client/client.hpp>

#include <utility>

#include <attest/crypto/public_key.hpp>
#include <attest/log.hpp>
#include <attest/state/error.hpp>
#include <attest/store/entry.hpp>
#include <attest/store/error.hpp>
#include <attest/store/verification.hpp>

namespace attest::client {

namespace {

enum class call_stage : std::uint8_t
{
  started,
  anchor_loaded,
  request_sent,
  digest_recomputed,
  inclusion_verified,
  dual_verified,
  anchor_advanced,
  rejected
};

constexpr std::string_view to_string( call_stage stage ) noexcept
{
  switch( stage )
  {
    case call_stage::started:
      return "started";
    case call_stage::anchor_loaded:
      return "anchor_loaded";
    case call_stage::request_sent:
      return "request_sent";
    case call_stage::digest_recomputed:
      return "digest_recomputed";
    case call_stage::inclusion_verified:
      return "inclusion_verified";
    case call_stage::dual_verified:
      return "dual_verified";
    case call_stage::anchor_advanced:
      return "anchor_advanced";
    case call_stage::rejected:
      return "rejected";
  }
  std::unreachable();
}

// Follows one verified call through its stages for the log.
class call_trace final
{
public:
  call_trace( std::string_view operation, const state::state_key& key ):
      _operation( operation ),
      _key( key )
  {}

  void advance( call_stage stage )
  {
    LOG_DEBUG( attest::log::instance(),
               "{} on {}:{}: {} -> {}",
               _operation,
               _key.server,
               _key.database,
               to_string( _stage ),
               to_string( stage ) );
    _stage = stage;
  }

  std::error_code reject( std::error_code ec )
  {
    if( is_tamper( ec ) )
      LOG_ERROR( attest::log::instance(),
                 "{} on {}:{} rejected after {}: {}",
                 _operation,
                 _key.server,
                 _key.database,
                 to_string( _stage ),
                 ec.message() );
    else
      LOG_WARNING( attest::log::instance(),
                   "{} on {}:{} failed after {}: {}",
                   _operation,
                   _key.server,
                   _key.database,
                   to_string( _stage ),
                   ec.message() );

    _stage = call_stage::rejected;
    return ec;
  }

private:
  std::string_view _operation;
  const state::state_key& _key;
  call_stage _stage = call_stage::started;
};

// Which side of a dual proof holds the transaction a call is about.
struct proof_direction
{
  std::uint64_t source_id = 0;
  crypto::digest source_alh{};
  std::uint64_t target_id = 0;
  crypto::digest target_alh{};
  store::tx_metadata tx_metadata;
};

/**
 * With a trusted state at or before `tx_id` the proof runs from the trusted
 * state to `tx_id`, otherwise from `tx_id` up to the trusted state. Either way
 * the metadata of `tx_id` travels in the proof.
 */
result< proof_direction >
select_direction( const state::trust_state& trusted, std::uint64_t tx_id, const store::dual_proof& proof )
{
  if( tx_id == 0 )
    return std::unexpected( client_errc::malformed_proof );

  proof_direction direction;

  if( trusted.tx_id <= tx_id )
  {
    if( !proof.target_tx_metadata )
      return std::unexpected( client_errc::malformed_proof );

    direction.tx_metadata = *proof.target_tx_metadata;
    direction.source_id   = trusted.tx_id;
    direction.source_alh  = trusted.tx_hash;
    direction.target_id   = tx_id;
    direction.target_alh  = direction.tx_metadata.alh();
  }
  else
  {
    if( !proof.source_tx_metadata )
      return std::unexpected( client_errc::malformed_proof );

    direction.tx_metadata = *proof.source_tx_metadata;
    direction.source_id   = tx_id;
    direction.source_alh  = direction.tx_metadata.alh();
    direction.target_id   = trusted.tx_id;
    direction.target_alh  = trusted.tx_hash;
  }

  if( direction.tx_metadata.id != tx_id )
    return std::unexpected( client_errc::tamper_detected );

  return direction;
}

std::error_code from_verification( const std::error_code& ec )
{
  if( ec.category() == store::store_category() || ec.category() == crypto::crypto_category() )
    return client_errc::malformed_proof;

  return ec;
}

std::error_code from_state( const std::error_code& ec )
{
  if( ec == state::state_errc::signature_missing || ec == state::state_errc::signature_invalid )
    return client_errc::signature_invalid;

  if( ec == state::state_errc::database_mismatch )
    return client_errc::tamper_detected;

  return ec;
}

result< void > verify_inclusion( call_trace& trace,
                                 const store::inclusion_proof& proof,
                                 const crypto::digest& digest,
                                 const crypto::digest& root )
{
  auto included = store::verify_inclusion( proof, digest, root );
  if( !included )
    return std::unexpected( trace.reject( from_verification( included.error() ) ) );

  if( !*included )
    return std::unexpected( trace.reject( client_errc::tamper_detected ) );

  trace.advance( call_stage::inclusion_verified );
  return {};
}

result< void > verify_dual( call_trace& trace, const store::dual_proof& proof, const proof_direction& direction )
{
  // Nothing is trusted yet, the first state is taken on faith.
  if( direction.source_id == 0 )
  {
    trace.advance( call_stage::dual_verified );
    return {};
  }

  auto consistent = store::verify_dual_proof( proof,
                                              direction.source_id,
                                              direction.target_id,
                                              direction.source_alh,
                                              direction.target_alh );
  if( !consistent )
    return std::unexpected( trace.reject( from_verification( consistent.error() ) ) );

  if( !*consistent )
    return std::unexpected( trace.reject( client_errc::tamper_detected ) );

  trace.advance( call_stage::dual_verified );
  return {};
}

// The transaction a response carries must agree with the metadata proven by the dual proof.
result< void > check_tx( call_trace& trace, const store::tx& tx, const proof_direction& direction )
{
  if( tx.metadata != direction.tx_metadata || tx.metadata.nentries != tx.entries.size() )
    return std::unexpected( trace.reject( client_errc::tamper_detected ) );

  if( tx.entries_root() != direction.tx_metadata.eh )
    return std::unexpected( trace.reject( client_errc::tamper_detected ) );

  return {};
}

/**
 * Checks a transaction returned by a write: it holds exactly the one entry that
 * was written and agrees with the metadata the dual proof carries.
 */
result< proof_direction > verify_write( call_trace& trace,
                                        const protocol::verifiable_tx& response,
                                        const store::encoded_kv& written,
                                        const state::trust_state& trusted )
{
  if( response.tx.metadata.nentries != 1 || response.tx.entries.size() != 1 )
    return std::unexpected( trace.reject( client_errc::tamper_detected ) );

  const auto digest = written.digest();
  trace.advance( call_stage::digest_recomputed );

  auto direction = select_direction( trusted, response.tx.metadata.id, response.dual_proof );
  if( !direction )
    return std::unexpected( trace.reject( direction.error() ) );

  if( auto matched = check_tx( trace, response.tx, *direction ); !matched )
    return std::unexpected( matched.error() );

  auto proof = response.tx.proof( written.key );
  if( !proof )
    return std::unexpected( trace.reject( client_errc::tamper_detected ) );

  if( auto included = verify_inclusion( trace, *proof, digest, direction->tx_metadata.eh ); !included )
    return std::unexpected( included.error() );

  if( auto consistent = verify_dual( trace, response.dual_proof, *direction ); !consistent )
    return std::unexpected( consistent.error() );

  return direction;
}

result< void > advance_anchor( call_trace& trace,
                               state::trust_cache& cache,
                               const state::state_key& key,
                               const proof_direction& direction,
                               const std::vector< std::byte >& signature )
{
  auto advanced = cache.set( key,
                             state::trust_state{ .database  = key.database,
                                                 .tx_id     = direction.target_id,
                                                 .tx_hash   = direction.target_alh,
                                                 .signature = signature } );
  if( !advanced )
    return std::unexpected( trace.reject( from_state( advanced.error() ) ) );

  trace.advance( call_stage::anchor_advanced );
  return {};
}

} // namespace

client::client( std::shared_ptr< ledger_service > service,
                std::shared_ptr< state::trust_cache > cache,
                std::string server_identity,
                std::string database ):
    _service( std::move( service ) ),
    _cache( std::move( cache ) ),
    _server_identity( std::move( server_identity ) ),
    _database( std::move( database ) )
{}

result< std::unique_ptr< client > > client::create( const options& opts, std::shared_ptr< ledger_service > service )
{
  if( !log::set_level( opts.log_level ) )
  {
    LOG_WARNING( log::instance(), "Unknown log level: {}", opts.log_level );
    return std::unexpected( client_errc::invalid_configuration );
  }

  std::shared_ptr< state::state_store > store;

  if( opts.state_dir )
    store = std::make_shared< state::file_state_store >( *opts.state_dir );
  else
    store = std::make_shared< state::memory_state_store >();

  auto c = std::make_unique< client >( std::move( service ),
                                       std::make_shared< state::trust_cache >( std::move( store ) ),
                                       opts.server_identity,
                                       opts.database );

  if( opts.public_key_file )
  {
    if( auto loaded = c->load_public_key_file( *opts.public_key_file ); !loaded )
      return std::unexpected( loaded.error() );
  }

  return c;
}

state::state_key client::trust_key() const
{
  return state::state_key{ .server = _server_identity, .database = _database };
}

void client::use_database( std::string database )
{
  _database = std::move( database );
}

const std::string& client::database() const noexcept
{
  return _database;
}

const std::string& client::server_identity() const noexcept
{
  return _server_identity;
}

const std::shared_ptr< state::trust_cache >& client::cache() const noexcept
{
  return _cache;
}

result< void > client::load_public_key( std::string_view pem )
{
  auto key = crypto::public_key::from_pem( pem );
  if( !key )
    return std::unexpected( client_errc::invalid_public_key );

  _cache->set_verifying_key( std::move( *key ) );
  return {};
}

result< void > client::load_public_key_file( const std::filesystem::path& path )
{
  auto key = crypto::public_key::from_pem_file( path );
  if( !key )
  {
    LOG_ERROR( attest::log::instance(), "Unable to load public key {}: {}", path.string(), key.error().message() );
    return std::unexpected( client_errc::invalid_public_key );
  }

  _cache->set_verifying_key( std::move( *key ) );
  return {};
}

result< state::trust_state > client::current_state()
{
  const auto k = trust_key();

  auto cached = _cache->get( k );
  if( !cached )
    return std::unexpected( cached.error() );

  if( *cached )
    return std::move( **cached );

  auto server_state = _service->current_state( _database );
  if( !server_state )
    return std::unexpected( server_state.error() );

  state::trust_state s{ .database  = std::move( server_state->database ),
                        .tx_id     = server_state->tx_id,
                        .tx_hash   = server_state->tx_hash,
                        .signature = std::move( server_state->signature ) };

  auto stored = _cache->set( k, s );
  if( !stored )
    return std::unexpected( from_state( stored.error() ) );

  if( *stored )
  {
    LOG_INFO( attest::log::instance(),
              "Bootstrapped {}:{} at tx {} ({})",
              k.server,
              k.database,
              s.tx_id,
              attest::log::hex{ s.tx_hash.data(), s.tx_hash.size() } );
    return s;
  }

  // Another call stored a state first.
  cached = _cache->get( k );
  if( !cached )
    return std::unexpected( cached.error() );

  if( !*cached )
    return s;

  return std::move( **cached );
}

result< verified_entry > client::verified_get( std::span< const std::byte > key )
{
  return get_entry( protocol::key_request{ .key = store::bytes( key.begin(), key.end() ) }, "verified_get" );
}

result< verified_entry > client::verified_get_at( std::span< const std::byte > key, std::uint64_t tx )
{
  return get_entry( protocol::key_request{ .key = store::bytes( key.begin(), key.end() ), .at_tx = tx },
                    "verified_get_at" );
}

result< verified_entry > client::verified_get_since( std::span< const std::byte > key, std::uint64_t tx )
{
  return get_entry( protocol::key_request{ .key = store::bytes( key.begin(), key.end() ), .since_tx = tx },
                    "verified_get_since" );
}

result< verified_entry > client::get_entry( const protocol::key_request& request, std::string_view operation )
{
  const auto k = trust_key();
  call_trace trace( operation, k );

  auto trusted = current_state();
  if( !trusted )
    return std::unexpected( trace.reject( trusted.error() ) );

  trace.advance( call_stage::anchor_loaded );

  auto response = _service->verifiable_get(
    _database,
    protocol::verifiable_get_request{ .key_request = request, .prove_since_tx = trusted->tx_id } );
  if( !response )
    return std::unexpected( trace.reject( response.error() ) );

  trace.advance( call_stage::request_sent );

  const auto& e = response->entry;
  store::entry leaf;
  std::uint64_t tx_id = 0;

  if( e.referenced_by )
  {
    if( e.referenced_by->key != request.key )
      return std::unexpected( trace.reject( client_errc::tamper_detected ) );

    if( request.at_tx != 0 && e.referenced_by->tx != request.at_tx )
      return std::unexpected( trace.reject( client_errc::tamper_detected ) );

    leaf  = store::reference_entry{ .key            = e.referenced_by->key,
                                    .referenced_key = e.key,
                                    .at_tx          = e.referenced_by->at_tx };
    tx_id = e.referenced_by->tx;
  }
  else
  {
    if( e.key != request.key )
      return std::unexpected( trace.reject( client_errc::tamper_detected ) );

    if( request.at_tx != 0 && e.tx != request.at_tx )
      return std::unexpected( trace.reject( client_errc::tamper_detected ) );

    leaf  = store::plain_entry{ .key = e.key, .value = e.value };
    tx_id = e.tx;
  }

  const auto digest = store::entry_digest( leaf );
  trace.advance( call_stage::digest_recomputed );

  auto direction = select_direction( *trusted, tx_id, response->verifiable_tx.dual_proof );
  if( !direction )
    return std::unexpected( trace.reject( direction.error() ) );

  if( auto included = verify_inclusion( trace, response->inclusion_proof, digest, direction->tx_metadata.eh );
      !included )
    return std::unexpected( included.error() );

  if( auto consistent = verify_dual( trace, response->verifiable_tx.dual_proof, *direction ); !consistent )
    return std::unexpected( consistent.error() );

  if( auto advanced = advance_anchor( trace, *_cache, k, *direction, response->verifiable_tx.signature ); !advanced )
    return std::unexpected( advanced.error() );

  verified_entry verified{ .tx        = e.tx,
                           .key       = e.key,
                           .value     = e.value,
                           .timestamp = direction->tx_metadata.ts,
                           .verified  = true };

  if( e.referenced_by )
  {
    verified.tx             = e.referenced_by->tx;
    verified.key            = e.referenced_by->key;
    verified.referenced_key = e.key;
  }

  return verified;
}

result< verified_tx > client::verified_set( std::span< const std::byte > key, std::span< const std::byte > value )
{
  const auto k = trust_key();
  call_trace trace( "verified_set", k );

  auto trusted = current_state();
  if( !trusted )
    return std::unexpected( trace.reject( trusted.error() ) );

  trace.advance( call_stage::anchor_loaded );

  auto response = _service->verifiable_set( _database,
                                            protocol::verifiable_set_request{
                                              .key            = store::bytes( key.begin(), key.end() ),
                                              .value          = store::bytes( value.begin(), value.end() ),
                                              .prove_since_tx = trusted->tx_id } );
  if( !response )
    return std::unexpected( trace.reject( response.error() ) );

  trace.advance( call_stage::request_sent );

  auto direction = verify_write( trace, *response, store::encode_plain( key, value ), *trusted );
  if( !direction )
    return std::unexpected( direction.error() );

  if( auto advanced = advance_anchor( trace, *_cache, k, *direction, response->signature ); !advanced )
    return std::unexpected( advanced.error() );

  return verified_tx{ .tx = std::move( response->tx ), .verified = true };
}

result< verified_tx > client::verified_set_reference( std::span< const std::byte > referenced_key,
                                                      std::span< const std::byte > key,
                                                      std::uint64_t at_tx )
{
  const auto k = trust_key();
  call_trace trace( "verified_set_reference", k );

  auto trusted = current_state();
  if( !trusted )
    return std::unexpected( trace.reject( trusted.error() ) );

  trace.advance( call_stage::anchor_loaded );

  auto response = _service->verifiable_set_reference(
    _database,
    protocol::verifiable_reference_request{ .key            = store::bytes( key.begin(), key.end() ),
                                            .referenced_key = store::bytes( referenced_key.begin(),
                                                                            referenced_key.end() ),
                                            .at_tx          = at_tx,
                                            .prove_since_tx = trusted->tx_id } );
  if( !response )
    return std::unexpected( trace.reject( response.error() ) );

  trace.advance( call_stage::request_sent );

  auto direction = verify_write( trace, *response, store::encode_reference( key, referenced_key, at_tx ), *trusted );
  if( !direction )
    return std::unexpected( direction.error() );

  if( auto advanced = advance_anchor( trace, *_cache, k, *direction, response->signature ); !advanced )
    return std::unexpected( advanced.error() );

  return verified_tx{ .tx = std::move( response->tx ), .verified = true };
}

result< verified_tx > client::verified_zadd( std::span< const std::byte > set,
                                             double score,
                                             std::span< const std::byte > key,
                                             std::uint64_t at_tx )
{
  const auto k = trust_key();
  call_trace trace( "verified_zadd", k );

  auto trusted = current_state();
  if( !trusted )
    return std::unexpected( trace.reject( trusted.error() ) );

  trace.advance( call_stage::anchor_loaded );

  auto response =
    _service->verifiable_zadd( _database,
                               protocol::verifiable_zadd_request{ .set   = store::bytes( set.begin(), set.end() ),
                                                                  .score = score,
                                                                  .key   = store::bytes( key.begin(), key.end() ),
                                                                  .at_tx = at_tx,
                                                                  .prove_since_tx = trusted->tx_id } );
  if( !response )
    return std::unexpected( trace.reject( response.error() ) );

  trace.advance( call_stage::request_sent );

  auto direction = verify_write( trace, *response, store::encode_zadd( set, score, key, at_tx ), *trusted );
  if( !direction )
    return std::unexpected( direction.error() );

  if( auto advanced = advance_anchor( trace, *_cache, k, *direction, response->signature ); !advanced )
    return std::unexpected( advanced.error() );

  return verified_tx{ .tx = std::move( response->tx ), .verified = true };
}

result< verified_tx > client::verified_tx_by_id( std::uint64_t tx )
{
  const auto k = trust_key();
  call_trace trace( "verified_tx_by_id", k );

  auto trusted = current_state();
  if( !trusted )
    return std::unexpected( trace.reject( trusted.error() ) );

  trace.advance( call_stage::anchor_loaded );

  auto response =
    _service->verifiable_tx_by_id( _database,
                                   protocol::verifiable_tx_request{ .tx = tx, .prove_since_tx = trusted->tx_id } );
  if( !response )
    return std::unexpected( trace.reject( response.error() ) );

  trace.advance( call_stage::request_sent );

  if( response->tx.metadata.id != tx )
    return std::unexpected( trace.reject( client_errc::tamper_detected ) );

  auto direction = select_direction( *trusted, tx, response->dual_proof );
  if( !direction )
    return std::unexpected( trace.reject( direction.error() ) );

  if( auto matched = check_tx( trace, response->tx, *direction ); !matched )
    return std::unexpected( matched.error() );

  trace.advance( call_stage::digest_recomputed );
  trace.advance( call_stage::inclusion_verified );

  if( auto consistent = verify_dual( trace, response->dual_proof, *direction ); !consistent )
    return std::unexpected( consistent.error() );

  if( auto advanced = advance_anchor( trace, *_cache, k, *direction, response->signature ); !advanced )
    return std::unexpected( advanced.error() );

  return verified_tx{ .tx = std::move( response->tx ), .verified = true };
}

} // namespace attest::client
