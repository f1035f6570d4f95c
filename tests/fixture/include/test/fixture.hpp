#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>

#include <gatekeeper/quota.hpp>
#include <gatekeeper/store.hpp>

namespace test {

/**
 * A service that owns resources and reports how many of them exist, keyed
 * by scope parameters the way a database backed service would count rows.
 */
class simulated_service
{
public:
  simulated_service( std::string name, std::string target );

  const std::string& name() const noexcept;
  const std::string& target() const noexcept;

  gatekeeper::quota::tag tag_for( gatekeeper::quota::scope s ) const;

  void create( const gatekeeper::quota::scope_parameters& owner, std::int64_t count = 1 );
  void fail_with( std::error_code ec );
  void set_latency( std::chrono::milliseconds latency );

  std::uint64_t calls() const noexcept;

  gatekeeper::quota::reporter_registration registration( gatekeeper::quota::limit_map defaults );

private:
  gatekeeper::quota::result< gatekeeper::quota::usage_map >
  report( std::stop_token stop, const std::optional< gatekeeper::quota::scope_parameters >& params );

  std::string _name;
  std::string _target;

  mutable std::mutex _mutex;
  std::int64_t _total = 0;
  std::map< std::int64_t, std::int64_t > _by_org;
  std::map< std::int64_t, std::int64_t > _by_user;
  std::error_code _failure;
  std::chrono::milliseconds _latency{ 0 };

  std::atomic< std::uint64_t > _calls{ 0 };
};

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  void register_services();

  std::shared_ptr< gatekeeper::store::memory_store > _store;
  std::unique_ptr< gatekeeper::quota::service > _quota;

  simulated_service _users;
  simulated_service _dashboards;
  simulated_service _alerts;
};

} // namespace test
