#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>

#include <gatekeeper/quota/error.hpp>
#include <gatekeeper/quota/scope.hpp>
#include <gatekeeper/quota/store.hpp>
#include <gatekeeper/quota/types.hpp>

namespace gatekeeper::quota {

/**
 * The quota decision interface used by the rest of the process.
 *
 * Services register a usage reporter and their default limits once at
 * startup with add_reporter(). Callers then ask whether a service has reached
 * its limit for a scope.
 */
class service
{
public:
  service()                 = default;
  service( const service& ) = delete;
  service( service&& )      = delete;
  virtual ~service()        = default;

  service& operator=( const service& ) = delete;
  service& operator=( service&& )      = delete;

  /**
   * Check the quota of target for the caller described by ctx.
   *
   * Without a request context the caller is a background task and the quota
   * is never reached. A signed in caller is checked against its organization
   * and user limits. An anonymous caller is only checked against global
   * limits.
   */
  virtual result< bool > quota_reached( const std::optional< request_context >& ctx, const std::string& target ) = 0;

  /**
   * Check whether the service target has reached any of its limits. Without
   * params only global limits are checked.
   */
  virtual result< bool > check_quota_reached( const std::string& target,
                                              const std::optional< scope_parameters >& params,
                                              std::stop_token stop ) = 0;

  /**
   * List the effective limit and current usage of every target at scope for
   * the organization or user id.
   */
  virtual result< std::vector< quota_status > >
  get( const std::string& scope_name, std::int64_t id, std::stop_token stop ) = 0;

  virtual std::error_code update( const update_quota_command& cmd ) = 0;
  virtual std::error_code delete_by_user( std::int64_t user_id )   = 0;
  virtual std::error_code add_reporter( reporter_registration registration ) = 0;
};

/**
 * Install the quota service.
 *
 * When enabled is false every call except add_reporter() fails with
 * quota_errc::disabled. configured_limits replace the defaults of the
 * services they name as those services register.
 */
std::unique_ptr< service > make_service( bool enabled,
                                         std::shared_ptr< override_store > store,
                                         limit_map configured_limits = {} );

} // namespace gatekeeper::quota
