#include <gatekeeper/config/config.hpp>

#include <gatekeeper/log.hpp>

#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace gatekeeper::config {

namespace {

result< quota::quota_map > parse_tags( const YAML::Node& node, const std::string& section )
{
  quota::quota_map values;

  if( !node )
    return values;

  if( !node.IsMap() )
  {
    LOG_ERROR( gatekeeper::log::instance(), "Configuration section '{}' must be a map", section );
    return std::unexpected( config_errc::invalid_value );
  }

  for( const auto& item: node )
  {
    auto t = quota::tag::from_string( item.first.as< std::string >() );
    if( auto s = t.get_scope(); !s )
    {
      LOG_ERROR( gatekeeper::log::instance(), "Invalid tag '{}' in '{}': {}", t.str(), section, s.error().message() );
      return std::unexpected( config_errc::invalid_value );
    }

    values.set( t, item.second.as< std::int64_t >() );
  }

  return values;
}

result< static_source > parse_source( const YAML::Node& node )
{
  static_source source;
  source.service = node[ "service" ].as< std::string >( "" );

  if( source.service.empty() )
  {
    LOG_ERROR( gatekeeper::log::instance(), "Usage source is missing a service name" );
    return std::unexpected( config_errc::invalid_value );
  }

  auto defaults = parse_tags( node[ "defaults" ], source.service + ".defaults" );
  if( !defaults )
    return std::unexpected( defaults.error() );

  auto usage = parse_tags( node[ "usage" ], source.service + ".usage" );
  if( !usage )
    return std::unexpected( usage.error() );

  source.defaults = std::move( *defaults );
  source.usage    = std::move( *usage );

  return source;
}

result< config > from_node( const YAML::Node& root )
{
  config cfg;

  if( const auto quota_node = root[ "quota" ]; quota_node )
  {
    cfg.enabled   = quota_node[ "enabled" ].as< bool >( false );
    cfg.log_level = quota_node[ "log-level" ].as< std::string >( default_log_level );

    auto limits = parse_tags( quota_node[ "limits" ], "quota.limits" );
    if( !limits )
      return std::unexpected( limits.error() );

    cfg.limits = std::move( *limits );
  }

  if( const auto sources = root[ "sources" ]; sources )
  {
    if( !sources.IsSequence() )
    {
      LOG_ERROR( gatekeeper::log::instance(), "Configuration section 'sources' must be a sequence" );
      return std::unexpected( config_errc::invalid_value );
    }

    for( const auto& node: sources )
    {
      auto source = parse_source( node );
      if( !source )
        return std::unexpected( source.error() );

      cfg.sources.emplace_back( std::move( *source ) );
    }
  }

  return cfg;
}

} // namespace

result< config > parse( std::string_view yaml )
{
  try
  {
    return from_node( YAML::Load( std::string( yaml ) ) );
  }
  catch( const YAML::BadConversion& e )
  {
    LOG_ERROR( gatekeeper::log::instance(), "Invalid configuration value: {}", e.what() );
    return std::unexpected( config_errc::invalid_value );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( gatekeeper::log::instance(), "Could not parse configuration: {}", e.what() );
    return std::unexpected( config_errc::parse_error );
  }
}

result< config > load( const std::filesystem::path& path )
{
  if( !std::filesystem::exists( path ) )
    return std::unexpected( config_errc::file_not_found );

  if( std::filesystem::is_directory( path ) )
  {
    LOG_ERROR( gatekeeper::log::instance(), "Configuration path {} is a directory", path.string() );
    return std::unexpected( config_errc::file_not_found );
  }

  std::ifstream ifs( path );
  if( !ifs )
  {
    LOG_ERROR( gatekeeper::log::instance(), "Could not open configuration {}", path.string() );
    return std::unexpected( config_errc::file_not_found );
  }

  std::stringstream contents;
  if( ifs.peek() != std::ifstream::traits_type::eof() )
    contents << ifs.rdbuf();

  if( ifs.bad() || contents.fail() )
  {
    LOG_ERROR( gatekeeper::log::instance(), "Could not read configuration {}", path.string() );
    return std::unexpected( config_errc::parse_error );
  }

  return parse( contents.str() );
}

} // namespace gatekeeper::config
