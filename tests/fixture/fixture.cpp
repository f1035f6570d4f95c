// NOLINTBEGIN

#include <test/fixture.hpp>

#include <stdexcept>
#include <system_error>
#include <thread>

#include <gatekeeper/log.hpp>

namespace test {

simulated_service::simulated_service( std::string name, std::string target ):
    _name( std::move( name ) ),
    _target( std::move( target ) )
{}

const std::string& simulated_service::name() const noexcept
{
  return _name;
}

const std::string& simulated_service::target() const noexcept
{
  return _target;
}

gatekeeper::quota::tag simulated_service::tag_for( gatekeeper::quota::scope s ) const
{
  auto t = gatekeeper::quota::make_tag( _name, _target, s );
  if( !t )
    throw std::invalid_argument( t.error().message() );

  return *t;
}

void simulated_service::create( const gatekeeper::quota::scope_parameters& owner, std::int64_t count )
{
  std::lock_guard< std::mutex > lock( _mutex );
  _total += count;
  _by_org[ owner.org_id ] += count;
  _by_user[ owner.user_id ] += count;
}

void simulated_service::fail_with( std::error_code ec )
{
  std::lock_guard< std::mutex > lock( _mutex );
  _failure = ec;
}

void simulated_service::set_latency( std::chrono::milliseconds latency )
{
  std::lock_guard< std::mutex > lock( _mutex );
  _latency = latency;
}

std::uint64_t simulated_service::calls() const noexcept
{
  return _calls.load();
}

gatekeeper::quota::reporter_registration simulated_service::registration( gatekeeper::quota::limit_map defaults )
{
  gatekeeper::quota::reporter_registration reg;
  reg.service  = _name;
  reg.reporter = [ this ]( std::stop_token stop, const std::optional< gatekeeper::quota::scope_parameters >& params )
  {
    return report( stop, params );
  };
  reg.default_limits = std::move( defaults );
  return reg;
}

gatekeeper::quota::result< gatekeeper::quota::usage_map >
simulated_service::report( std::stop_token stop, const std::optional< gatekeeper::quota::scope_parameters >& params )
{
  ++_calls;

  std::chrono::milliseconds latency;
  {
    std::lock_guard< std::mutex > lock( _mutex );
    latency = _latency;
  }

  if( latency.count() > 0 )
    std::this_thread::sleep_for( latency );

  if( stop.stop_requested() )
    return std::unexpected( std::make_error_code( std::errc::operation_canceled ) );

  std::lock_guard< std::mutex > lock( _mutex );

  if( _failure )
    return std::unexpected( _failure );

  gatekeeper::quota::usage_map usage;
  usage.set( tag_for( gatekeeper::quota::scope::global ), _total );

  if( gatekeeper::quota::applicable( gatekeeper::quota::scope::org, params ) )
  {
    auto itr = _by_org.find( params->org_id );
    usage.set( tag_for( gatekeeper::quota::scope::org ), itr == _by_org.end() ? 0 : itr->second );
  }

  if( gatekeeper::quota::applicable( gatekeeper::quota::scope::user, params ) )
  {
    auto itr = _by_user.find( params->user_id );
    usage.set( tag_for( gatekeeper::quota::scope::user ), itr == _by_user.end() ? 0 : itr->second );
  }

  return usage;
}

fixture::fixture( const std::string& name, const std::string& log_level ):
    _store( std::make_shared< gatekeeper::store::memory_store >() ),
    _users( "users", "user" ),
    _dashboards( "dashboards", "dashboard" ),
    _alerts( "alerts", "alert_rule" )
{
  gatekeeper::log::initialize();
  gatekeeper::log::set_level( log_level );

  LOG_INFO( gatekeeper::log::instance(), "Starting fixture: {}", name );

  _quota = gatekeeper::quota::make_service( true, _store );
}

fixture::~fixture() = default;

void fixture::register_services()
{
  using gatekeeper::quota::scope;

  auto ec = _quota->add_reporter( _users.registration( {
    {_users.tag_for( scope::global ), 1'000},
    {   _users.tag_for( scope::org ),    10}
  } ) );
  if( ec )
    throw std::system_error( ec );

  ec = _quota->add_reporter( _dashboards.registration( {
    {_dashboards.tag_for( scope::org ), 100},
    {_dashboards.tag_for( scope::user ),  5}
  } ) );
  if( ec )
    throw std::system_error( ec );

  ec = _quota->add_reporter( _alerts.registration( {
    {_alerts.tag_for( scope::global ), -1},
    {   _alerts.tag_for( scope::org ),  0}
  } ) );
  if( ec )
    throw std::system_error( ec );
}

} // namespace test

// NOLINTEND
