#pragma once

#include <cstdint>
#include <optional>
#include <system_error>

#include <gatekeeper/quota/map.hpp>
#include <gatekeeper/quota/scope.hpp>
#include <gatekeeper/quota/tag.hpp>
#include <gatekeeper/quota/types.hpp>

namespace gatekeeper::quota {

/**
 * Persists custom limits that override service defaults.
 */
class override_store
{
public:
  override_store()                        = default;
  override_store( const override_store& ) = delete;
  override_store( override_store&& )      = delete;
  virtual ~override_store()               = default;

  override_store& operator=( const override_store& ) = delete;
  override_store& operator=( override_store&& )      = delete;

  /**
   * Return every override visible for the given parameters: global
   * overrides, organization overrides for params->org_id and user
   * overrides for params->user_id.
   */
  virtual result< limit_map > get( const std::optional< scope_parameters >& params ) const = 0;

  /**
   * Insert or replace the override for t. Repeating an update is harmless.
   */
  virtual std::error_code update( const tag& t, const update_quota_command& cmd ) = 0;

  /**
   * Remove every user scoped override belonging to user_id.
   */
  virtual std::error_code delete_by_user( std::int64_t user_id ) = 0;
};

} // namespace gatekeeper::quota
