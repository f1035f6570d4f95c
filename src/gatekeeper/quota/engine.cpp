#include <gatekeeper/quota/engine.hpp>
#include <gatekeeper/quota/limit_resolver.hpp>
#include <gatekeeper/quota/usage_aggregator.hpp>

#include <gatekeeper/log.hpp>

#include <exception>
#include <stdexcept>
#include <utility>

namespace gatekeeper::quota {

engine::engine( std::shared_ptr< override_store > store, limit_map configured_limits ):
    _store( std::move( store ) ),
    _configured_limits( std::move( configured_limits ) )
{
  if( !_store )
    throw std::invalid_argument( "quota engine requires an override store" );
}

engine::~engine() = default;

result< bool > engine::quota_reached( const std::optional< request_context >& ctx, const std::string& target )
{
  // Background jobs have no request context and are never limited
  if( !ctx )
  {
    LOG_DEBUG( gatekeeper::log::instance(), "No request context for target '{}', quota not enforced", target );
    return false;
  }

  std::optional< scope_parameters > params;
  if( ctx->signed_in )
    params = scope_parameters{ .org_id = ctx->org_id, .user_id = ctx->user_id };

  return check_quota_reached( target, params, ctx->stop );
}

result< bool > engine::check_quota_reached( const std::string& target,
                                            const std::optional< scope_parameters >& params,
                                            std::stop_token stop )
{
  limit_resolver resolver( _default_limits, *_store );

  auto limits = resolver.resolve( target, params );
  if( !limits )
    return std::unexpected( limits.error() );

  auto reporter = _registry.get( target );
  if( !reporter )
    return std::unexpected( quota_errc::invalid_target_service );

  result< usage_map > usage;
  try
  {
    usage = ( *reporter )( stop, params );
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( gatekeeper::log::instance(), "Usage reporter for service '{}' threw: {}", target, e.what() );
    return std::unexpected( quota_errc::usage_reporter_failed );
  }
  catch( ... )
  {
    LOG_ERROR( gatekeeper::log::instance(), "Usage reporter for service '{}' threw an unknown exception", target );
    return std::unexpected( quota_errc::usage_reporter_failed );
  }

  if( !usage )
  {
    if( !usage.error() )
      return std::unexpected( quota_errc::usage_reporter_failed );

    return std::unexpected( usage.error() );
  }

  for( const auto& [ t, limit ]: *limits )
  {
    if( limit < 0 )
      continue;

    if( limit == 0 )
    {
      LOG_DEBUG( gatekeeper::log::instance(), "Quota reached for {}, target is blocked", t );
      return true;
    }

    auto used = usage->get( t );
    if( !used )
    {
      LOG_WARNING( gatekeeper::log::instance(), "No usage reported for {}", t );
      return std::unexpected( quota_errc::usage_unavailable );
    }

    if( *used >= limit )
    {
      LOG_DEBUG( gatekeeper::log::instance(), "Quota reached for {} - Used: {}, Limit: {}", t, *used, limit );
      return true;
    }
  }

  return false;
}

result< std::vector< quota_status > > engine::get( const std::string& scope_name, std::int64_t id, std::stop_token stop )
{
  auto requested = scope_from_string( scope_name );
  if( !requested )
    return std::unexpected( requested.error() );

  scope_parameters params;
  if( *requested == scope::org )
    params.org_id = id;
  else if( *requested == scope::user )
    params.user_id = id;

  auto overrides = _store->get( params );
  if( !overrides )
    return std::unexpected( overrides.error() );

  usage_aggregator aggregator( _registry );

  auto usage = aggregator.aggregate( params, stop );
  if( !usage )
    return std::unexpected( usage.error() );

  std::vector< quota_status > statuses;

  for( const auto& [ t, default_limit ]: _default_limits.entries() )
  {
    auto tag_scope = t.get_scope();
    if( !tag_scope )
      return std::unexpected( tag_scope.error() );

    if( *tag_scope != *requested )
      continue;

    auto target = t.target();
    if( !target )
      return std::unexpected( target.error() );

    auto owner = t.service();
    if( !owner )
      return std::unexpected( owner.error() );

    quota_status status;
    status.target      = std::move( *target );
    status.limit       = overrides->get( t ).value_or( default_limit );
    status.org_id      = params.org_id;
    status.user_id     = params.user_id;
    status.used        = usage->get( t ).value_or( 0 );
    status.service     = std::move( *owner );
    status.quota_scope = *requested;

    statuses.emplace_back( std::move( status ) );
  }

  return statuses;
}

std::error_code engine::update( const update_quota_command& cmd )
{
  auto targets = _default_limits.targets();
  if( !targets )
    return targets.error();

  if( !targets->contains( cmd.target ) )
  {
    LOG_WARNING( gatekeeper::log::instance(), "Rejected quota update for unknown target '{}'", cmd.target );
    return quota_errc::invalid_target;
  }

  auto t = command_tag( cmd );
  if( !t )
    return t.error();

  if( auto ec = _store->update( *t, cmd ); ec )
    return ec;

  LOG_INFO( gatekeeper::log::instance(),
            "Updated quota {} - Limit: {}, Org: {}, User: {}",
            *t,
            cmd.limit,
            cmd.org_id,
            cmd.user_id );

  return {};
}

std::error_code engine::delete_by_user( std::int64_t user_id )
{
  if( auto ec = _store->delete_by_user( user_id ); ec )
    return ec;

  LOG_INFO( gatekeeper::log::instance(), "Deleted quotas of user {}", user_id );
  return {};
}

std::error_code engine::add_reporter( reporter_registration registration )
{
  if( auto ec = validate( registration ); ec )
  {
    LOG_WARNING( gatekeeper::log::instance(),
                 "Rejected usage reporter for service '{}': {}",
                 registration.service,
                 ec.message() );
    return ec;
  }

  std::lock_guard< std::mutex > lock( _registration_mutex );

  if( auto ec = _registry.add( registration.service, std::move( registration.reporter ) ); ec )
  {
    LOG_WARNING( gatekeeper::log::instance(), "Service '{}' already has a usage reporter", registration.service );
    return ec;
  }

  _default_limits.merge( registration.default_limits );

  for( const auto& [ t, limit ]: _configured_limits.entries() )
  {
    auto owner = t.service();
    if( !owner || *owner != registration.service )
      continue;

    if( !_default_limits.get( t ) )
    {
      LOG_WARNING( gatekeeper::log::instance(), "Ignoring configured limit for {}, not a default of the service", t );
      continue;
    }

    _default_limits.set( t, limit );
  }

  LOG_INFO( gatekeeper::log::instance(),
            "Registered usage reporter for service '{}' with {} default limit(s)",
            registration.service,
            registration.default_limits.size() );

  return {};
}

const limit_map& engine::default_limits() const noexcept
{
  return _default_limits;
}

const reporter_registry& engine::registry() const noexcept
{
  return _registry;
}

result< tag > engine::command_tag( const update_quota_command& cmd ) const
{
  const auto command_scope = cmd.command_scope();

  for( const auto& [ t, limit ]: _default_limits.entries() )
  {
    auto target = t.target();
    if( !target )
      return std::unexpected( target.error() );

    if( *target != cmd.target )
      continue;

    auto s = t.get_scope();
    if( !s )
      return std::unexpected( s.error() );

    if( *s == command_scope )
      return t;
  }

  LOG_WARNING( gatekeeper::log::instance(),
               "Target '{}' has no {} scoped quota",
               cmd.target,
               command_scope );

  return std::unexpected( quota_errc::invalid_target );
}

std::error_code engine::validate( const reporter_registration& registration ) const
{
  if( registration.service.empty() || registration.service.find( tag_separator ) != std::string::npos )
    return quota_errc::invalid_registration;

  if( !registration.reporter )
    return quota_errc::invalid_registration;

  for( const auto& [ t, limit ]: registration.default_limits.entries() )
  {
    auto owner = t.service();
    if( !owner )
      return owner.error();

    if( auto s = t.get_scope(); !s )
      return s.error();

    if( *owner != registration.service )
      return quota_errc::invalid_registration;
  }

  return {};
}

} // namespace gatekeeper::quota
