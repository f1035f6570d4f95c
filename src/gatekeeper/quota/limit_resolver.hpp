#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <gatekeeper/quota/map.hpp>
#include <gatekeeper/quota/store.hpp>

namespace gatekeeper::quota {

/**
 * Computes the effective limits of one service by substituting stored
 * overrides for the defaults contributed at registration.
 */
class limit_resolver final
{
public:
  limit_resolver( const limit_map& defaults, const override_store& store );

  /**
   * Only tags owned by service whose scope applies to params are returned.
   */
  result< std::map< tag, std::int64_t > > resolve( const std::string& service,
                                                   const std::optional< scope_parameters >& params ) const;

private:
  const limit_map& _defaults;
  const override_store& _store;
};

} // namespace gatekeeper::quota
