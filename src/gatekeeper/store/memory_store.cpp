#include <gatekeeper/store/memory_store.hpp>

#include <mutex>

namespace gatekeeper::store {

quota::result< quota::limit_map > memory_store::get( const std::optional< quota::scope_parameters >& params ) const
{
  quota::limit_map limits;

  std::shared_lock< std::shared_mutex > lock( _mutex );

  collect( quota::scope::global, 0, limits );

  if( params && params->org_id != 0 )
    collect( quota::scope::org, params->org_id, limits );

  if( params && params->user_id != 0 )
    collect( quota::scope::user, params->user_id, limits );

  return limits;
}

std::error_code memory_store::update( const quota::tag& t, const quota::update_quota_command& cmd )
{
  if( cmd.org_id < 0 || cmd.user_id < 0 )
    return store_errc::invalid_command;

  auto tag_scope = t.get_scope();
  if( !tag_scope )
    return store_errc::invalid_tag;

  auto target = t.target();
  if( !target || *target != cmd.target )
    return store_errc::invalid_tag;

  const auto command_scope = cmd.command_scope();
  if( *tag_scope != command_scope )
    return store_errc::invalid_command;

  std::int64_t id = 0;
  if( command_scope == quota::scope::org )
    id = cmd.org_id;
  else if( command_scope == quota::scope::user )
    id = cmd.user_id;

  std::unique_lock< std::shared_mutex > lock( _mutex );
  _overrides.insert_or_assign( key_type{ command_scope, id, t }, cmd.limit );

  return {};
}

std::error_code memory_store::delete_by_user( std::int64_t user_id )
{
  if( user_id <= 0 )
    return store_errc::invalid_command;

  std::unique_lock< std::shared_mutex > lock( _mutex );

  std::erase_if( _overrides,
                 [ user_id ]( const auto& item )
                 {
                   const auto& [ s, id, t ] = item.first;
                   return s == quota::scope::user && id == user_id;
                 } );

  return {};
}

std::size_t memory_store::size() const
{
  std::shared_lock< std::shared_mutex > lock( _mutex );
  return _overrides.size();
}

void memory_store::collect( quota::scope s, std::int64_t id, quota::limit_map& limits ) const
{
  auto itr = _overrides.lower_bound( key_type{ s, id, quota::tag{} } );

  for( ; itr != _overrides.end(); ++itr )
  {
    const auto& [ key_scope, key_id, t ] = itr->first;
    if( key_scope != s || key_id != id )
      break;

    limits.set( t, itr->second );
  }
}

} // namespace gatekeeper::store
