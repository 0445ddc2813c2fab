#include <attest/client/options.hpp>

#include <attest/log.hpp>

namespace attest::client {

namespace constants {

constexpr auto client_section  = "client";
constexpr auto global_section  = "global";
constexpr auto server_identity = "server-identity";
constexpr auto database        = "database";
constexpr auto state_dir       = "state-dir";
constexpr auto public_key_file = "public-key";
constexpr auto log_level       = "log-level";

} // namespace constants

namespace {

template< typename T >
std::optional< T > get_option( const char* key, const YAML::Node& client_config, const YAML::Node& global_config )
{
  if( client_config && client_config[ key ] )
    return client_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return {};
}

std::filesystem::path resolve( const std::filesystem::path& path, const std::filesystem::path& basedir )
{
  if( path.is_relative() )
    return basedir / path;

  return path;
}

} // namespace

result< options > parse_options( const YAML::Node& config, const std::filesystem::path& basedir )
{
  options opts;

  try
  {
    YAML::Node client_config;
    YAML::Node global_config;

    if( config && config.IsMap() )
    {
      client_config = config[ constants::client_section ];
      global_config = config[ constants::global_section ];
    }

    if( auto value = get_option< std::string >( constants::server_identity, client_config, global_config ) )
      opts.server_identity = *value;

    if( auto value = get_option< std::string >( constants::database, client_config, global_config ) )
      opts.database = *value;

    if( auto value = get_option< std::string >( constants::state_dir, client_config, global_config ) )
      opts.state_dir = resolve( *value, basedir );

    if( auto value = get_option< std::string >( constants::public_key_file, client_config, global_config ) )
      opts.public_key_file = resolve( *value, basedir );

    if( auto value = get_option< std::string >( constants::log_level, client_config, global_config ) )
      opts.log_level = *value;
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( attest::log::instance(), "Invalid client configuration: {}", e.what() );
    return std::unexpected( client_errc::invalid_configuration );
  }

  if( opts.server_identity.empty() || opts.database.empty() )
    return std::unexpected( client_errc::invalid_configuration );

  return opts;
}

result< options > load_options( const std::filesystem::path& yaml_path )
{
  YAML::Node config;

  try
  {
    config = YAML::LoadFile( yaml_path.string() );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( attest::log::instance(), "Unable to load {}: {}", yaml_path.string(), e.what() );
    return std::unexpected( client_errc::invalid_configuration );
  }

  return parse_options( config, yaml_path.parent_path() );
}

} // namespace attest::client
