#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <attest/client/options.hpp>
#include <attest/crypto.hpp>
#include <attest/encode.hpp>
#include <attest/log.hpp>
#include <attest/state.hpp>

namespace constants {

constexpr auto help_option       = "help,h";
constexpr auto version_option    = "version,v";
constexpr auto basedir_option    = "basedir,d";
constexpr auto basedir_default   = ".attest";
constexpr auto log_level_option  = "log-level,l";
constexpr auto state_dir_option  = "state-dir,s";
constexpr auto state_dir_default = "state";
constexpr auto public_key_option = "public-key,k";
constexpr auto server_option     = "server";
constexpr auto database_option   = "database";
constexpr auto show_option       = "show";
constexpr auto reset_option      = "reset";

} // namespace constants

using namespace attest;

namespace {

std::string signature_status( const state::trust_state& s, const std::optional< crypto::public_key >& key )
{
  if( !key )
    return "unchecked";

  if( s.signature.empty() )
    return "unsigned";

  return state::check_signature( s, *key ) ? "valid" : "invalid";
}

void print_state( const state::state_key& k,
                  const state::trust_state& s,
                  const std::optional< crypto::public_key >& key )
{
  std::println( "{} {} tx={} hash={} signature={}",
                k.server,
                k.database,
                s.tx_id,
                encode::to_hex( s.tx_hash ),
                signature_status( s, key ) );
}

} // namespace

auto main( int argc, char** argv ) -> int
{
  int retcode = EXIT_SUCCESS;

  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option      , "Print this help message and exit" )
      ( constants::version_option   , "Print version string and exit" )
      ( constants::basedir_option   , boost::program_options::value< std::string >()->default_value( constants::basedir_default ), "Client base directory" )
      ( constants::log_level_option , boost::program_options::value< std::string >(), "The log filtering level" )
      ( constants::state_dir_option , boost::program_options::value< std::string >(), "The trust state directory (absolute path or relative to basedir)" )
      ( constants::public_key_option, boost::program_options::value< std::string >(), "PEM public key used to check state signatures" )
      ( constants::server_option    , boost::program_options::value< std::string >(), "Server identity" )
      ( constants::database_option  , boost::program_options::value< std::string >(), "Database name" )
      ( constants::show_option      , "Print the trusted state of the selected server and database" )
      ( constants::reset_option     , "Forget the trusted state of the selected server and database" );
    // clang-format on

    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );

    if( args.count( "help" ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::println( "v0.1.0" );
      return EXIT_SUCCESS;
    }

    log::initialize();

    if( auto initialized = crypto::initialize(); !initialized )
    {
      LOG_ERROR( log::instance(), "Unable to initialize crypto: {}", initialized.error().message() );
      return EXIT_FAILURE;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    auto opts = std::filesystem::exists( yaml_config ) ? client::load_options( yaml_config )
                                                       : client::parse_options( YAML::Node(), basedir );
    if( !opts )
    {
      LOG_ERROR( log::instance(), "Unable to read configuration: {}", opts.error().message() );
      return EXIT_FAILURE;
    }

    if( args.count( "log-level" ) )
      opts->log_level = args[ "log-level" ].as< std::string >();
    if( args.count( "state-dir" ) )
      opts->state_dir = basedir / args[ "state-dir" ].as< std::string >();
    if( args.count( "public-key" ) )
      opts->public_key_file = basedir / args[ "public-key" ].as< std::string >();
    if( args.count( "server" ) )
      opts->server_identity = args[ "server" ].as< std::string >();
    if( args.count( "database" ) )
      opts->database = args[ "database" ].as< std::string >();

    if( !opts->state_dir )
      opts->state_dir = basedir / constants::state_dir_default;

    if( !log::set_level( opts->log_level ) )
    {
      LOG_ERROR( log::instance(), "Unknown log level: {}", opts->log_level );
      return EXIT_FAILURE;
    }

    std::optional< crypto::public_key > key;
    if( opts->public_key_file )
    {
      auto loaded = crypto::public_key::from_pem_file( *opts->public_key_file );
      if( !loaded )
      {
        LOG_ERROR( log::instance(),
                   "Unable to load public key {}: {}",
                   opts->public_key_file->string(),
                   loaded.error().message() );
        return EXIT_FAILURE;
      }
      key = std::move( *loaded );
    }

    state::file_state_store store( *opts->state_dir );
    const state::state_key selected{ .server = opts->server_identity, .database = opts->database };

    if( args.count( "reset" ) )
    {
      if( auto removed = store.remove( selected ); !removed )
      {
        LOG_ERROR( log::instance(), "Unable to reset {}:{}: {}", selected.server, selected.database, removed.error().message() );
        return EXIT_FAILURE;
      }

      LOG_INFO( log::instance(), "Reset trusted state of {}:{}", selected.server, selected.database );
    }
    else if( args.count( "show" ) )
    {
      auto loaded = store.load( selected );
      if( !loaded )
      {
        LOG_ERROR( log::instance(), "Unable to read {}:{}: {}", selected.server, selected.database, loaded.error().message() );
        return EXIT_FAILURE;
      }

      if( !*loaded )
      {
        LOG_WARNING( log::instance(), "No trusted state for {}:{}", selected.server, selected.database );
        return EXIT_FAILURE;
      }

      print_state( selected, **loaded, key );
    }
    else
    {
      auto states = store.list();
      if( !states )
      {
        LOG_ERROR( log::instance(), "Unable to list {}: {}", opts->state_dir->string(), states.error().message() );
        return EXIT_FAILURE;
      }

      for( const auto& [ k, s ]: *states )
      {
        print_state( k, s, key );

        if( key && !s.signature.empty() && !state::check_signature( s, *key ) )
          retcode = EXIT_FAILURE;
      }
    }
  }
  catch( const boost::program_options::error& e )
  {
    std::println( std::cerr, "{}", e.what() );
    retcode = EXIT_FAILURE;
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( log::instance(), "An unexpected error has occurred: {}", e.what() );
    retcode = EXIT_FAILURE;
  }

  return retcode;
}
