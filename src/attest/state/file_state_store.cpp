#include <attest/state/state_store.hpp>

#include <fstream>
#include <utility>
#include <system_error>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include <attest/crypto/hash.hpp>
#include <attest/encode.hpp>
#include <attest/log.hpp>

namespace attest::state {

namespace {

constexpr auto state_extension = ".state";
constexpr auto temp_extension  = ".tmp";

struct state_record
{
  state_key key;
  trust_state state;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & key.server;
    ar & key.database;
    ar & state;
  }
};

result< state_record > read_record( const std::filesystem::path& path )
{
  std::ifstream file( path, std::ios::binary );
  if( !file )
    return std::unexpected( state_errc::io_error );

  state_record record;

  try
  {
    boost::archive::binary_iarchive archive( file );
    archive >> record;
  }
  catch( const boost::archive::archive_exception& e )
  {
    LOG_WARNING( attest::log::instance(), "Unable to read trust state {}: {}", path.string(), e.what() );
    return std::unexpected( state_errc::corrupted_state );
  }

  return record;
}

} // namespace

file_state_store::file_state_store( std::filesystem::path directory ):
    _directory( std::move( directory ) )
{}

const std::filesystem::path& file_state_store::directory() const noexcept
{
  return _directory;
}

std::filesystem::path file_state_store::path_for( const state_key& key ) const
{
  crypto::hasher_reset();
  crypto::hasher_update( static_cast< std::uint64_t >( key.server.size() ) );
  crypto::hasher_update( key.server );
  crypto::hasher_update( key.database );
  auto id = crypto::hasher_finalize();

  return _directory / ( encode::to_hex( id, encode::hex_prefix::none ) + state_extension );
}

result< std::optional< trust_state > > file_state_store::load( const state_key& key )
{
  auto path = path_for( key );

  std::error_code ec;
  if( !std::filesystem::exists( path, ec ) )
  {
    if( ec )
      return std::unexpected( state_errc::io_error );

    return std::optional< trust_state >{};
  }

  auto record = read_record( path );
  if( !record )
    return std::unexpected( record.error() );

  if( record->key != key || record->state.database != key.database )
    return std::unexpected( state_errc::corrupted_state );

  return std::move( record->state );
}

result< void > file_state_store::save( const state_key& key, const trust_state& s )
{
  std::error_code ec;
  std::filesystem::create_directories( _directory, ec );
  if( ec )
  {
    LOG_ERROR( attest::log::instance(), "Unable to create state directory {}: {}", _directory.string(), ec.message() );
    return std::unexpected( state_errc::io_error );
  }

  auto path = path_for( key );
  auto temp = std::filesystem::path( path ).concat( temp_extension );

  {
    std::ofstream file( temp, std::ios::binary | std::ios::trunc );
    if( !file )
      return std::unexpected( state_errc::io_error );

    state_record record{ .key = key, .state = s };

    try
    {
      boost::archive::binary_oarchive archive( file );
      archive << record;
    }
    catch( const boost::archive::archive_exception& e )
    {
      LOG_ERROR( attest::log::instance(), "Unable to write trust state {}: {}", temp.string(), e.what() );
      return std::unexpected( state_errc::io_error );
    }

    file.flush();
    if( !file )
      return std::unexpected( state_errc::io_error );
  }

  std::filesystem::rename( temp, path, ec );
  if( ec )
  {
    LOG_ERROR( attest::log::instance(), "Unable to replace trust state {}: {}", path.string(), ec.message() );

    std::error_code cleanup_ec;
    if( !std::filesystem::remove( temp, cleanup_ec ) && cleanup_ec )
      LOG_WARNING( attest::log::instance(), "Unable to remove {}: {}", temp.string(), cleanup_ec.message() );

    return std::unexpected( state_errc::io_error );
  }

  return {};
}

result< void > file_state_store::remove( const state_key& key )
{
  std::error_code ec;
  std::filesystem::remove( path_for( key ), ec );

  if( ec )
    return std::unexpected( state_errc::io_error );

  return {};
}

result< std::vector< std::pair< state_key, trust_state > > > file_state_store::list()
{
  std::vector< std::pair< state_key, trust_state > > states;

  std::error_code ec;
  if( !std::filesystem::exists( _directory, ec ) )
    return states;

  for( const auto& item: std::filesystem::directory_iterator( _directory, ec ) )
  {
    if( !item.is_regular_file( ec ) || item.path().extension() != state_extension )
      continue;

    auto record = read_record( item.path() );
    if( !record )
      return std::unexpected( record.error() );

    states.emplace_back( std::move( record->key ), std::move( record->state ) );
  }

  if( ec )
    return std::unexpected( state_errc::io_error );

  return states;
}

} // namespace attest::state
