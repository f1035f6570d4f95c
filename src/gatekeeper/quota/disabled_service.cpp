#include <gatekeeper/quota/disabled_service.hpp>

namespace gatekeeper::quota {

result< bool > disabled_service::quota_reached( const std::optional< request_context >&, const std::string& )
{
  return std::unexpected( quota_errc::disabled );
}

result< bool >
disabled_service::check_quota_reached( const std::string&, const std::optional< scope_parameters >&, std::stop_token )
{
  return std::unexpected( quota_errc::disabled );
}

result< std::vector< quota_status > > disabled_service::get( const std::string&, std::int64_t, std::stop_token )
{
  return std::unexpected( quota_errc::disabled );
}

std::error_code disabled_service::update( const update_quota_command& )
{
  return quota_errc::disabled;
}

std::error_code disabled_service::delete_by_user( std::int64_t )
{
  return quota_errc::disabled;
}

std::error_code disabled_service::add_reporter( reporter_registration )
{
  return {};
}

} // namespace gatekeeper::quota
