#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <stop_token>
#include <string>

#include <boost/program_options.hpp>

#include <gatekeeper/config.hpp>
#include <gatekeeper/log.hpp>
#include <gatekeeper/quota.hpp>
#include <gatekeeper/store.hpp>

namespace constants {

constexpr auto help_option        = "help,h";
constexpr auto version_option     = "version,v";
constexpr auto config_option      = "config,c";
constexpr auto config_default     = "quotad.yml";
constexpr auto log_level_option   = "log-level,l";
constexpr auto enabled_option     = "enabled";
constexpr auto check_option       = "check";
constexpr auto list_option        = "list";
constexpr auto id_option          = "id";
constexpr auto org_option         = "org";
constexpr auto user_option        = "user";
constexpr auto set_option         = "set";
constexpr auto limit_option       = "limit";
constexpr auto delete_user_option = "delete-user";

} // namespace constants

namespace {

gatekeeper::quota::usage_reporter make_static_reporter( gatekeeper::quota::usage_map usage )
{
  return [ usage = std::move( usage ) ]( std::stop_token, const std::optional< gatekeeper::quota::scope_parameters >& params )
           -> gatekeeper::quota::result< gatekeeper::quota::usage_map >
  {
    gatekeeper::quota::usage_map reported;

    for( const auto& [ t, used ]: usage.entries() )
    {
      auto s = t.get_scope();
      if( !s )
        return std::unexpected( s.error() );

      if( gatekeeper::quota::applicable( *s, params ) )
        reported.set( t, used );
    }

    return reported;
  };
}

} // namespace

auto main( int argc, char** argv ) -> int
{
  gatekeeper::log::initialize();

  boost::program_options::options_description options;

  // clang-format off
  options.add_options()
    ( constants::help_option       , "Print this help message and exit" )
    ( constants::version_option    , "Print version string and exit" )
    ( constants::config_option     , boost::program_options::value< std::string >()->default_value( constants::config_default ), "The configuration file" )
    ( constants::log_level_option  , boost::program_options::value< std::string >(), "The log filtering level" )
    ( constants::enabled_option    , boost::program_options::value< bool >()       , "Enable or disable quota enforcement" )
    ( constants::check_option      , boost::program_options::value< std::string >(), "Check whether the service has reached its quota" )
    ( constants::list_option       , boost::program_options::value< std::string >(), "List quotas of a scope (global, org, user)" )
    ( constants::id_option         , boost::program_options::value< std::int64_t >()->default_value( 0 ), "The organization or user id to list" )
    ( constants::org_option        , boost::program_options::value< std::int64_t >()->default_value( 0 ), "The organization id" )
    ( constants::user_option       , boost::program_options::value< std::int64_t >()->default_value( 0 ), "The user id" )
    ( constants::set_option        , boost::program_options::value< std::string >(), "Set a custom limit for a target" )
    ( constants::limit_option      , boost::program_options::value< std::int64_t >(), "The custom limit" )
    ( constants::delete_user_option, boost::program_options::value< std::int64_t >(), "Delete the custom limits of a user" );
  // clang-format on

  boost::program_options::variables_map args;

  try
  {
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );
  }
  catch( const boost::program_options::error& e )
  {
    LOG_ERROR( gatekeeper::log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  if( args.count( "help" ) )
  {
    options.print( std::cout );
    return EXIT_SUCCESS;
  }

  if( args.count( "version" ) )
  {
    std::println( "quotad v0.1.0" );
    return EXIT_SUCCESS;
  }

  gatekeeper::config::config cfg;

  auto config_path = std::filesystem::path( args[ "config" ].as< std::string >() );
  if( auto loaded = gatekeeper::config::load( config_path ); loaded )
  {
    cfg = std::move( *loaded );
  }
  else if( loaded.error() == gatekeeper::config::config_errc::file_not_found )
  {
    LOG_WARNING( gatekeeper::log::instance(),
                 "Could not find config at {}. Using default values",
                 config_path.string() );
  }
  else
  {
    LOG_ERROR( gatekeeper::log::instance(), "Could not load {}: {}", config_path.string(), loaded.error().message() );
    return EXIT_FAILURE;
  }

  if( args.count( "log-level" ) )
    cfg.log_level = args[ "log-level" ].as< std::string >();

  if( args.count( "enabled" ) )
    cfg.enabled = args[ "enabled" ].as< bool >();

  if( !gatekeeper::log::set_level( cfg.log_level ) )
    return EXIT_FAILURE;

  auto service = gatekeeper::quota::make_service( cfg.enabled,
                                                  std::make_shared< gatekeeper::store::memory_store >(),
                                                  cfg.limits );

  for( auto& source: cfg.sources )
  {
    gatekeeper::quota::reporter_registration registration;
    registration.service        = source.service;
    registration.reporter       = make_static_reporter( std::move( source.usage ) );
    registration.default_limits = std::move( source.defaults );

    if( auto ec = service->add_reporter( std::move( registration ) ); ec )
    {
      LOG_ERROR( gatekeeper::log::instance(), "Could not register service '{}': {}", source.service, ec.message() );
      return EXIT_FAILURE;
    }
  }

  const auto org_id  = args[ "org" ].as< std::int64_t >();
  const auto user_id = args[ "user" ].as< std::int64_t >();

  if( args.count( "set" ) )
  {
    if( !args.count( "limit" ) )
    {
      LOG_ERROR( gatekeeper::log::instance(), "--set requires --limit" );
      return EXIT_FAILURE;
    }

    gatekeeper::quota::update_quota_command cmd;
    cmd.target  = args[ "set" ].as< std::string >();
    cmd.limit   = args[ "limit" ].as< std::int64_t >();
    cmd.org_id  = org_id;
    cmd.user_id = user_id;

    if( auto ec = service->update( cmd ); ec )
    {
      LOG_ERROR( gatekeeper::log::instance(), "Could not update quota of '{}': {}", cmd.target, ec.message() );
      return EXIT_FAILURE;
    }
  }

  if( args.count( "delete-user" ) )
  {
    if( auto ec = service->delete_by_user( args[ "delete-user" ].as< std::int64_t >() ); ec )
    {
      LOG_ERROR( gatekeeper::log::instance(), "Could not delete user quotas: {}", ec.message() );
      return EXIT_FAILURE;
    }
  }

  if( args.count( "check" ) )
  {
    const auto target = args[ "check" ].as< std::string >();

    std::optional< gatekeeper::quota::scope_parameters > params;
    if( org_id != 0 || user_id != 0 )
      params = gatekeeper::quota::scope_parameters{ .org_id = org_id, .user_id = user_id };

    auto reached = service->check_quota_reached( target, params, {} );
    if( !reached )
    {
      LOG_ERROR( gatekeeper::log::instance(), "Could not check quota of '{}': {}", target, reached.error().message() );
      return EXIT_FAILURE;
    }

    std::println( "{}: {}", target, *reached ? "reached" : "available" );
  }

  if( args.count( "list" ) )
  {
    auto statuses = service->get( args[ "list" ].as< std::string >(), args[ "id" ].as< std::int64_t >(), {} );
    if( !statuses )
    {
      LOG_ERROR( gatekeeper::log::instance(), "Could not list quotas: {}", statuses.error().message() );
      return EXIT_FAILURE;
    }

    for( const auto& status: *statuses )
    {
      std::println( "{:<16} {:<16} {:<6} org={} user={} used={} limit={}",
                    status.service,
                    status.target,
                    gatekeeper::quota::to_string( status.quota_scope ),
                    status.org_id,
                    status.user_id,
                    status.used,
                    status.limit );
    }
  }

  return EXIT_SUCCESS;
}
