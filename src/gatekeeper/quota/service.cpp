#include <gatekeeper/quota/disabled_service.hpp>
#include <gatekeeper/quota/engine.hpp>
#include <gatekeeper/quota/service.hpp>

#include <gatekeeper/log.hpp>

namespace gatekeeper::quota {

std::unique_ptr< service >
make_service( bool enabled, std::shared_ptr< override_store > store, limit_map configured_limits )
{
  if( !enabled )
  {
    LOG_INFO( gatekeeper::log::instance(), "Quota enforcement is disabled" );
    return std::make_unique< disabled_service >();
  }

  LOG_INFO( gatekeeper::log::instance(), "Quota enforcement is enabled" );
  return std::make_unique< engine >( std::move( store ), std::move( configured_limits ) );
}

} // namespace gatekeeper::quota
