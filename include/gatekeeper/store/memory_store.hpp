#pragma once

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <tuple>

#include <gatekeeper/quota/store.hpp>
#include <gatekeeper/store/error.hpp>

namespace gatekeeper::store {

/**
 * memory_store keeps quota overrides in process memory.
 *
 * Overrides are keyed by scope, the organization or user id the scope
 * refers to (zero for global overrides) and the tag. Reads take a shared
 * lock, writes an exclusive one.
 */
class memory_store final: public quota::override_store
{
public:
  memory_store()           = default;
  ~memory_store() override = default;

  quota::result< quota::limit_map > get( const std::optional< quota::scope_parameters >& params ) const override;
  std::error_code update( const quota::tag& t, const quota::update_quota_command& cmd ) override;
  std::error_code delete_by_user( std::int64_t user_id ) override;

  std::size_t size() const;

private:
  using key_type = std::tuple< quota::scope, std::int64_t, quota::tag >;

  void collect( quota::scope s, std::int64_t id, quota::limit_map& limits ) const;

  std::map< key_type, std::int64_t > _overrides;
  mutable std::shared_mutex _mutex;
};

} // namespace gatekeeper::store
