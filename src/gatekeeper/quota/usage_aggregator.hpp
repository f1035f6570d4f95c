#pragma once

#include <optional>
#include <stop_token>

#include <gatekeeper/quota/map.hpp>
#include <gatekeeper/quota/reporter_registry.hpp>

namespace gatekeeper::quota {

/**
 * usage_aggregator collects the usage of every registered service.
 *
 * Each reporter runs as its own task on a thread pool that lives for the
 * duration of the call. The first failure requests a stop on the shared stop
 * source and becomes the result of the call. Aggregation is all or nothing.
 */
class usage_aggregator final
{
public:
  explicit usage_aggregator( const reporter_registry& registry );

  result< usage_map > aggregate( const std::optional< scope_parameters >& params, std::stop_token stop ) const;

private:
  const reporter_registry& _registry;
};

} // namespace gatekeeper::quota
