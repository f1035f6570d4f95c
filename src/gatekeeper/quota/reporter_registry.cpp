#include <gatekeeper/quota/reporter_registry.hpp>

#include <mutex>

namespace gatekeeper::quota {

std::error_code reporter_registry::add( const std::string& service, usage_reporter reporter )
{
  std::unique_lock< std::shared_mutex > lock( _mutex );

  if( _reporters.contains( service ) )
    return quota_errc::target_service_conflict;

  _reporters.emplace( service, std::move( reporter ) );
  return {};
}

std::optional< usage_reporter > reporter_registry::get( const std::string& service ) const
{
  std::shared_lock< std::shared_mutex > lock( _mutex );

  if( auto itr = _reporters.find( service ); itr != _reporters.end() )
    return itr->second;

  return {};
}

std::vector< reporter_registry::entry > reporter_registry::snapshot() const
{
  std::shared_lock< std::shared_mutex > lock( _mutex );
  return std::vector< entry >( _reporters.begin(), _reporters.end() );
}

bool reporter_registry::contains( const std::string& service ) const
{
  std::shared_lock< std::shared_mutex > lock( _mutex );
  return _reporters.contains( service );
}

std::size_t reporter_registry::size() const
{
  std::shared_lock< std::shared_mutex > lock( _mutex );
  return _reporters.size();
}

} // namespace gatekeeper::quota
