// NOLINTBEGIN

#include <test/fixture.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <variant>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <attest/log.hpp>

namespace test {

namespace {

constexpr std::int64_t genesis_time = 1'700'000'000;

} // namespace

signing_key::signing_key( type t ):
    _type( t )
{
  EVP_PKEY* key = t == type::ec_p256 ? EVP_EC_gen( "P-256" ) : EVP_PKEY_Q_keygen( nullptr, nullptr, "ED25519" );
  if( !key )
    throw std::runtime_error( "unable to generate signing key" );

  _key = std::shared_ptr< EVP_PKEY >( key, EVP_PKEY_free );
}

std::vector< std::byte > signing_key::sign( std::span< const std::byte > message ) const
{
  std::unique_ptr< EVP_MD_CTX, decltype( &EVP_MD_CTX_free ) > ctx( EVP_MD_CTX_new(), EVP_MD_CTX_free );
  if( !ctx )
    throw std::runtime_error( "unable to allocate signing context" );

  const EVP_MD* md = _type == type::ec_p256 ? EVP_sha256() : nullptr;
  if( EVP_DigestSignInit( ctx.get(), nullptr, md, nullptr, _key.get() ) != 1 )
    throw std::runtime_error( "unable to initialize signing context" );

  const auto* data = attest::memory::pointer_cast< const unsigned char* >( message.data() );

  std::size_t len = 0;
  if( EVP_DigestSign( ctx.get(), nullptr, &len, data, message.size() ) != 1 )
    throw std::runtime_error( "unable to size signature" );

  std::vector< std::byte > signature( len );
  if( EVP_DigestSign( ctx.get(),
                      attest::memory::pointer_cast< unsigned char* >( signature.data() ),
                      &len,
                      data,
                      message.size() )
      != 1 )
    throw std::runtime_error( "unable to sign" );

  signature.resize( len );
  return signature;
}

std::string signing_key::public_pem() const
{
  std::unique_ptr< BIO, decltype( &BIO_free ) > bio( BIO_new( BIO_s_mem() ), BIO_free );
  if( !bio || PEM_write_bio_PUBKEY( bio.get(), _key.get() ) != 1 )
    throw std::runtime_error( "unable to encode public key" );

  char* data = nullptr;
  auto len   = BIO_get_mem_data( bio.get(), &data );
  return std::string( data, static_cast< std::size_t >( len ) );
}

mock_ledger::mock_ledger( std::string database, signing_key::type key_type ):
    _database( std::move( database ) ),
    _key( key_type )
{}

std::uint64_t mock_ledger::commit( const std::vector< attest::store::entry >& entries )
{
  std::lock_guard< std::mutex > lock( _mutex );
  return commit_locked( entries );
}

std::uint64_t mock_ledger::commit_locked( const std::vector< attest::store::entry >& entries )
{
  attest::store::tx t;
  t.metadata.id       = _txs.size() + 1;
  t.metadata.prev_alh = _alhs.empty() ? attest::crypto::digest{} : _alhs.back();
  t.metadata.ts       = genesis_time + static_cast< std::int64_t >( t.metadata.id );
  t.metadata.nentries = static_cast< std::uint32_t >( entries.size() );

  for( const auto& e: entries )
    t.entries.emplace_back( attest::store::make_tx_entry( attest::store::encode( e ) ) );

  t.metadata.eh       = t.entries_root();
  t.metadata.bl_tx_id = t.metadata.id - 1;
  t.metadata.bl_root  = _bl_tree.root();

  auto alh = t.metadata.alh();
  _alhs.emplace_back( alh );
  _bl_tree.append( alh );
  _entries.emplace_back( entries );
  _txs.emplace_back( std::move( t ) );

  return _txs.size();
}

std::uint64_t mock_ledger::set( std::string_view key, std::string_view value )
{
  return commit( { attest::store::plain_entry{ .key = to_bytes( key ), .value = to_bytes( value ) } } );
}

std::uint64_t mock_ledger::set_reference( std::string_view referenced_key, std::string_view key, std::uint64_t at_tx )
{
  return commit( { attest::store::reference_entry{ .key            = to_bytes( key ),
                                                   .referenced_key = to_bytes( referenced_key ),
                                                   .at_tx          = at_tx } } );
}

std::uint64_t mock_ledger::zadd( std::string_view set, double score, std::string_view key, std::uint64_t at_tx )
{
  return commit( { attest::store::sorted_set_entry{ .set   = to_bytes( set ),
                                                    .score = score,
                                                    .key   = to_bytes( key ),
                                                    .at_tx = at_tx } } );
}

std::uint64_t mock_ledger::last_tx_id() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _txs.size();
}

attest::store::tx mock_ledger::tx( std::uint64_t id ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _txs.at( id - 1 );
}

attest::crypto::digest mock_ledger::alh( std::uint64_t id ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _alhs.at( id - 1 );
}

attest::store::dual_proof mock_ledger::dual_proof( std::uint64_t source, std::uint64_t target ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return dual_proof_locked( source, target );
}

attest::state::trust_state mock_ledger::signed_state( std::uint64_t id ) const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return signed_state_locked( id );
}

const std::string& mock_ledger::database() const noexcept
{
  return _database;
}

std::string mock_ledger::public_pem() const
{
  return _key.public_pem();
}

void mock_ledger::sign_states( bool enabled )
{
  std::lock_guard< std::mutex > lock( _mutex );
  _sign_states = enabled;
}

void mock_ledger::fail_next( std::error_code ec )
{
  std::lock_guard< std::mutex > lock( _mutex );
  _failure = ec;
}

std::uint64_t mock_ledger::calls() const
{
  std::lock_guard< std::mutex > lock( _mutex );
  return _calls;
}

attest::client::result< void > mock_ledger::begin_call( const std::string& database )
{
  ++_calls;

  if( _failure )
  {
    auto ec = *_failure;
    _failure.reset();
    return std::unexpected( ec );
  }

  if( database != _database )
    return std::unexpected( std::make_error_code( std::errc::invalid_argument ) );

  return {};
}

std::optional< mock_ledger::located > mock_ledger::find_locked( std::span< const std::byte > key,
                                                                std::uint64_t at_tx ) const
{
  const auto encoded_key = attest::store::encode_key( key );

  auto matches = [ & ]( std::uint64_t id ) -> std::optional< located >
  {
    for( const auto& e: _entries[ id - 1 ] )
    {
      if( attest::store::encode( e ).key == encoded_key )
        return located{ .tx = id, .entry = e };
    }

    return {};
  };

  if( at_tx != 0 )
  {
    if( at_tx > _txs.size() )
      return {};

    return matches( at_tx );
  }

  for( auto id = _txs.size(); id > 0; --id )
  {
    if( auto found = matches( id ) )
      return found;
  }

  return {};
}

attest::store::linear_proof mock_ledger::linear_proof_locked( std::uint64_t source, std::uint64_t target ) const
{
  attest::store::linear_proof proof{ .source_tx_id = source, .target_tx_id = target };
  proof.terms.emplace_back( _alhs[ source - 1 ] );

  for( auto id = source + 1; id <= target; ++id )
    proof.terms.emplace_back( _txs[ id - 1 ].metadata.inner_hash() );

  return proof;
}

attest::store::dual_proof mock_ledger::dual_proof_locked( std::uint64_t source, std::uint64_t target ) const
{
  const auto& source_md = _txs.at( source - 1 ).metadata;
  const auto& target_md = _txs.at( target - 1 ).metadata;

  attest::store::dual_proof proof;
  proof.source_tx_metadata = source_md;
  proof.target_tx_metadata = target_md;

  if( source < target_md.bl_tx_id )
    proof.bl_inclusion_proof = *_bl_tree.inclusion_proof( source - 1, target_md.bl_tx_id );

  if( source_md.bl_tx_id > 0 )
    proof.bl_consistency_proof = *_bl_tree.consistency_proof( source_md.bl_tx_id, target_md.bl_tx_id );

  if( target_md.bl_tx_id > 0 )
  {
    proof.bl_last_inclusion_proof = *_bl_tree.inclusion_proof( target_md.bl_tx_id - 1, target_md.bl_tx_id );
    proof.target_bl_tx_alh        = _alhs[ target_md.bl_tx_id - 1 ];
  }

  if( source < target_md.bl_tx_id )
    proof.linear = linear_proof_locked( target_md.bl_tx_id, target );
  else
    proof.linear = linear_proof_locked( source, target );

  return proof;
}

attest::state::trust_state mock_ledger::signed_state_locked( std::uint64_t id ) const
{
  attest::state::trust_state s{ .database = _database,
                                .tx_id    = id,
                                .tx_hash  = id == 0 ? attest::crypto::digest{} : _alhs.at( id - 1 ) };

  if( _sign_states )
    s.signature = _key.sign( attest::state::signing_bytes( s ) );

  return s;
}

attest::protocol::verifiable_tx mock_ledger::verifiable_tx_locked( std::uint64_t id,
                                                                   std::uint64_t prove_since_tx ) const
{
  auto source = prove_since_tx == 0 ? id : std::min( prove_since_tx, id );
  auto target = std::max( prove_since_tx, id );

  attest::protocol::verifiable_tx vtx;
  vtx.tx         = _txs.at( id - 1 );
  vtx.dual_proof = dual_proof_locked( source, target );
  vtx.signature  = signed_state_locked( target ).signature;
  return vtx;
}

attest::client::result< attest::protocol::immutable_state > mock_ledger::current_state( const std::string& database )
{
  std::lock_guard< std::mutex > lock( _mutex );

  if( auto ok = begin_call( database ); !ok )
    return std::unexpected( ok.error() );

  auto s = signed_state_locked( _txs.size() );
  attest::protocol::immutable_state state{ .database  = s.database,
                                           .tx_id     = s.tx_id,
                                           .tx_hash   = s.tx_hash,
                                           .signature = s.signature };

  if( on_state )
    on_state( state );

  return state;
}

attest::client::result< attest::protocol::verifiable_entry >
mock_ledger::verifiable_get( const std::string& database, const attest::protocol::verifiable_get_request& request )
{
  std::lock_guard< std::mutex > lock( _mutex );

  if( auto ok = begin_call( database ); !ok )
    return std::unexpected( ok.error() );

  if( request.prove_since_tx > _txs.size() || request.key_request.since_tx > _txs.size() )
    return std::unexpected( std::make_error_code( std::errc::invalid_argument ) );

  auto found = find_locked( request.key_request.key, request.key_request.at_tx );
  if( !found )
    return std::unexpected( std::make_error_code( std::errc::no_such_file_or_directory ) );

  attest::protocol::verifiable_entry ventry;

  if( const auto* ref = std::get_if< attest::store::reference_entry >( &found->entry ) )
  {
    auto target = find_locked( ref->referenced_key, ref->at_tx );
    if( !target )
      return std::unexpected( std::make_error_code( std::errc::no_such_file_or_directory ) );

    const auto* plain = std::get_if< attest::store::plain_entry >( &target->entry );
    if( !plain )
      return std::unexpected( std::make_error_code( std::errc::invalid_argument ) );

    ventry.entry = attest::protocol::entry{
      .tx            = target->tx,
      .key           = plain->key,
      .value         = plain->value,
      .referenced_by = attest::protocol::reference{ .tx = found->tx, .key = ref->key, .at_tx = ref->at_tx } };
  }
  else
  {
    const auto& plain = std::get< attest::store::plain_entry >( found->entry );
    ventry.entry      = attest::protocol::entry{ .tx = found->tx, .key = plain.key, .value = plain.value };
  }

  const auto& leaf_tx    = _txs[ found->tx - 1 ];
  ventry.inclusion_proof = *leaf_tx.proof( attest::store::encode( found->entry ).key );
  ventry.verifiable_tx   = verifiable_tx_locked( found->tx, request.prove_since_tx );

  if( on_entry )
    on_entry( ventry );

  return ventry;
}

attest::client::result< attest::protocol::verifiable_tx >
mock_ledger::verifiable_set( const std::string& database, const attest::protocol::verifiable_set_request& request )
{
  std::lock_guard< std::mutex > lock( _mutex );

  if( auto ok = begin_call( database ); !ok )
    return std::unexpected( ok.error() );

  if( request.prove_since_tx > _txs.size() )
    return std::unexpected( std::make_error_code( std::errc::invalid_argument ) );

  auto id  = commit_locked( { attest::store::plain_entry{ .key = request.key, .value = request.value } } );
  auto vtx = verifiable_tx_locked( id, request.prove_since_tx );

  if( on_tx )
    on_tx( vtx );

  return vtx;
}

attest::client::result< attest::protocol::verifiable_tx >
mock_ledger::verifiable_set_reference( const std::string& database,
                                       const attest::protocol::verifiable_reference_request& request )
{
  std::lock_guard< std::mutex > lock( _mutex );

  if( auto ok = begin_call( database ); !ok )
    return std::unexpected( ok.error() );

  if( request.prove_since_tx > _txs.size() )
    return std::unexpected( std::make_error_code( std::errc::invalid_argument ) );

  if( !find_locked( request.referenced_key, request.at_tx ) )
    return std::unexpected( std::make_error_code( std::errc::no_such_file_or_directory ) );

  auto id  = commit_locked( { attest::store::reference_entry{ .key            = request.key,
                                                              .referenced_key = request.referenced_key,
                                                              .at_tx          = request.at_tx } } );
  auto vtx = verifiable_tx_locked( id, request.prove_since_tx );

  if( on_tx )
    on_tx( vtx );

  return vtx;
}

attest::client::result< attest::protocol::verifiable_tx >
mock_ledger::verifiable_zadd( const std::string& database, const attest::protocol::verifiable_zadd_request& request )
{
  std::lock_guard< std::mutex > lock( _mutex );

  if( auto ok = begin_call( database ); !ok )
    return std::unexpected( ok.error() );

  if( request.prove_since_tx > _txs.size() )
    return std::unexpected( std::make_error_code( std::errc::invalid_argument ) );

  auto id  = commit_locked( { attest::store::sorted_set_entry{ .set   = request.set,
                                                               .score = request.score,
                                                               .key   = request.key,
                                                               .at_tx = request.at_tx } } );
  auto vtx = verifiable_tx_locked( id, request.prove_since_tx );

  if( on_tx )
    on_tx( vtx );

  return vtx;
}

attest::client::result< attest::protocol::verifiable_tx >
mock_ledger::verifiable_tx_by_id( const std::string& database, const attest::protocol::verifiable_tx_request& request )
{
  std::lock_guard< std::mutex > lock( _mutex );

  if( auto ok = begin_call( database ); !ok )
    return std::unexpected( ok.error() );

  if( request.tx == 0 || request.tx > _txs.size() || request.prove_since_tx > _txs.size() )
    return std::unexpected( std::make_error_code( std::errc::invalid_argument ) );

  auto vtx = verifiable_tx_locked( request.tx, request.prove_since_tx );

  if( on_tx )
    on_tx( vtx );

  return vtx;
}

fixture::fixture( const std::string& log_level, signing_key::type key_type )
{
  attest::log::initialize();
  attest::log::set_level( log_level );

  if( auto initialized = attest::crypto::initialize(); !initialized )
    throw std::runtime_error( initialized.error().message() );

  _ledger = std::make_shared< mock_ledger >( "defaultdb", key_type );
  _cache  = std::make_shared< attest::state::trust_cache >();
  _client = std::make_unique< attest::client::client >( _ledger, _cache, "mock:3322", _ledger->database() );
}

attest::state::state_key fixture::key() const
{
  return attest::state::state_key{ .server = _client->server_identity(), .database = _client->database() };
}

std::uint64_t fixture::trusted_tx_id() const
{
  auto trusted = _cache->get( key() );
  if( !trusted || !*trusted )
    return 0;

  return ( *trusted )->tx_id;
}

void fixture::trust( std::uint64_t id )
{
  auto stored = _cache->set( key(), _ledger->signed_state( id ) );
  if( !stored || !*stored )
    throw std::runtime_error( "unable to trust state" );
}

} // namespace test

// NOLINTEND
