#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

#include <gatekeeper/quota/error.hpp>
#include <gatekeeper/quota/map.hpp>
#include <gatekeeper/quota/scope.hpp>

namespace gatekeeper::quota {

/**
 * One row of a quota listing.
 */
struct quota_status
{
  std::string target;
  std::int64_t limit   = 0;
  std::int64_t org_id  = 0;
  std::int64_t user_id = 0;
  std::int64_t used    = 0;
  std::string service;
  scope quota_scope = scope::global;
};

/**
 * Sets a custom limit for a target.
 *
 * The scope is taken from the ids: an organization id selects the
 * organization scope, otherwise a user id selects the user scope, otherwise
 * the limit is global.
 */
struct update_quota_command
{
  std::string target;
  std::int64_t limit   = 0;
  std::int64_t org_id  = 0;
  std::int64_t user_id = 0;

  scope command_scope() const noexcept
  {
    if( org_id != 0 )
      return scope::org;

    if( user_id != 0 )
      return scope::user;

    return scope::global;
  }
};

/**
 * Reports the current usage of a service's targets for the given scope.
 *
 * Implementations should observe the stop token. A reporter that keeps
 * running after a stop request has its result discarded.
 */
using usage_reporter = std::function< result< usage_map >( std::stop_token, const std::optional< scope_parameters >& ) >;

struct reporter_registration
{
  std::string service;
  usage_reporter reporter;
  limit_map default_limits;
};

} // namespace gatekeeper::quota
