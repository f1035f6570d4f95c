#include <gatekeeper/quota/scope.hpp>

namespace gatekeeper::quota {

result< scope > scope_from_string( std::string_view text )
{
  if( text == to_string( scope::global ) )
    return scope::global;

  if( text == to_string( scope::org ) )
    return scope::org;

  if( text == to_string( scope::user ) )
    return scope::user;

  return std::unexpected( quota_errc::invalid_scope );
}

bool applicable( scope s, const std::optional< scope_parameters >& params ) noexcept
{
  switch( s )
  {
    case scope::global:
      return true;
    case scope::org:
      return params && params->org_id != 0;
    case scope::user:
      return params && params->user_id != 0;
  }

  return false;
}

} // namespace gatekeeper::quota
