#include <gatekeeper/quota/map.hpp>

#include <mutex>

namespace gatekeeper::quota {

quota_map::quota_map( std::initializer_list< entry > entries )
{
  for( const auto& [ t, value ]: entries )
    _values.insert_or_assign( t, value );
}

quota_map::quota_map( const quota_map& other )
{
  std::shared_lock< std::shared_mutex > lock( other._mutex );
  _values = other._values;
}

quota_map::quota_map( quota_map&& other ) noexcept
{
  std::unique_lock< std::shared_mutex > lock( other._mutex );
  _values = std::move( other._values );
}

quota_map& quota_map::operator=( const quota_map& other )
{
  if( this == &other )
    return *this;

  auto values = other.entries();

  std::unique_lock< std::shared_mutex > lock( _mutex );
  _values = std::map< tag, std::int64_t >( values.begin(), values.end() );
  return *this;
}

quota_map& quota_map::operator=( quota_map&& other ) noexcept
{
  if( this == &other )
    return *this;

  std::scoped_lock lock( _mutex, other._mutex );
  _values = std::move( other._values );
  return *this;
}

void quota_map::set( const tag& t, std::int64_t value )
{
  std::unique_lock< std::shared_mutex > lock( _mutex );
  _values.insert_or_assign( t, value );
}

std::optional< std::int64_t > quota_map::get( const tag& t ) const
{
  std::shared_lock< std::shared_mutex > lock( _mutex );

  if( auto itr = _values.find( t ); itr != _values.end() )
    return itr->second;

  return {};
}

void quota_map::merge( const quota_map& other )
{
  if( this == &other )
    return;

  auto values = other.entries();

  std::unique_lock< std::shared_mutex > lock( _mutex );
  for( auto& [ t, value ]: values )
    _values.insert_or_assign( std::move( t ), value );
}

std::vector< quota_map::entry > quota_map::entries() const
{
  std::shared_lock< std::shared_mutex > lock( _mutex );
  return std::vector< entry >( _values.begin(), _values.end() );
}

result< std::set< std::string > > quota_map::services() const
{
  std::set< std::string > services;

  for( const auto& [ t, value ]: entries() )
  {
    auto service = t.service();
    if( !service )
      return std::unexpected( service.error() );

    services.insert( std::move( *service ) );
  }

  return services;
}

result< std::set< std::string > > quota_map::targets() const
{
  std::set< std::string > targets;

  for( const auto& [ t, value ]: entries() )
  {
    auto target = t.target();
    if( !target )
      return std::unexpected( target.error() );

    targets.insert( std::move( *target ) );
  }

  return targets;
}

result< std::set< scope > > quota_map::scopes() const
{
  std::set< scope > scopes;

  for( const auto& [ t, value ]: entries() )
  {
    auto s = t.get_scope();
    if( !s )
      return std::unexpected( s.error() );

    scopes.insert( *s );
  }

  return scopes;
}

std::size_t quota_map::size() const
{
  std::shared_lock< std::shared_mutex > lock( _mutex );
  return _values.size();
}

bool quota_map::empty() const
{
  std::shared_lock< std::shared_mutex > lock( _mutex );
  return _values.empty();
}

} // namespace gatekeeper::quota
