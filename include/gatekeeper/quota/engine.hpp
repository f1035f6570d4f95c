#pragma once

#include <memory>
#include <mutex>

#include <gatekeeper/quota/map.hpp>
#include <gatekeeper/quota/reporter_registry.hpp>
#include <gatekeeper/quota/service.hpp>
#include <gatekeeper/quota/store.hpp>

namespace gatekeeper::quota {

/**
 * engine is the enabled quota service.
 *
 * It owns the reporter registry and the default limits contributed by every
 * registered service. Both are only written by add_reporter() and are read
 * concurrently by every other call.
 *
 * Limits of a service are evaluated in tag order. The first tag that is at
 * its limit ends the check. A tag with a positive limit and no reported usage
 * fails the whole check with quota_errc::usage_unavailable unless a tag
 * ordered before it was already reached.
 */
class engine final: public service
{
public:
  explicit engine( std::shared_ptr< override_store > store, limit_map configured_limits = {} );
  ~engine() override;

  result< bool > quota_reached( const std::optional< request_context >& ctx, const std::string& target ) override;
  result< bool > check_quota_reached( const std::string& target,
                                      const std::optional< scope_parameters >& params,
                                      std::stop_token stop ) override;
  result< std::vector< quota_status > >
  get( const std::string& scope_name, std::int64_t id, std::stop_token stop ) override;
  std::error_code update( const update_quota_command& cmd ) override;
  std::error_code delete_by_user( std::int64_t user_id ) override;
  std::error_code add_reporter( reporter_registration registration ) override;

  const limit_map& default_limits() const noexcept;
  const reporter_registry& registry() const noexcept;

private:
  result< tag > command_tag( const update_quota_command& cmd ) const;
  std::error_code validate( const reporter_registration& registration ) const;

  std::shared_ptr< override_store > _store;
  limit_map _configured_limits;
  limit_map _default_limits;
  reporter_registry _registry;
  std::mutex _registration_mutex;
};

} // namespace gatekeeper::quota
