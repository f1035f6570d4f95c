#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <gatekeeper/quota/types.hpp>

namespace gatekeeper::quota {

/**
 * reporter_registry maps a service name to its usage reporter.
 *
 * Registration happens once per service, normally while the process starts.
 * Lookups happen on every quota check and only take a shared lock.
 */
class reporter_registry final
{
public:
  using entry = std::pair< std::string, usage_reporter >;

  reporter_registry() = default;
  reporter_registry( const reporter_registry& ) = delete;
  reporter_registry( reporter_registry&& )      = delete;
  ~reporter_registry()                          = default;

  reporter_registry& operator=( const reporter_registry& ) = delete;
  reporter_registry& operator=( reporter_registry&& )      = delete;

  /**
   * Register a reporter for service.
   *
   * Fails with quota_errc::target_service_conflict if service already has a
   * reporter. The existing reporter is kept.
   */
  std::error_code add( const std::string& service, usage_reporter reporter );

  std::optional< usage_reporter > get( const std::string& service ) const;

  /**
   * Copy the current registrations so that they can be iterated without
   * holding the registry lock.
   */
  std::vector< entry > snapshot() const;

  bool contains( const std::string& service ) const;
  std::size_t size() const;

private:
  std::map< std::string, usage_reporter > _reporters;
  mutable std::shared_mutex _mutex;
};

} // namespace gatekeeper::quota
