#pragma once

#include <gatekeeper/quota/service.hpp>

namespace gatekeeper::quota {

class disabled_service final: public service
{
public:
  disabled_service()           = default;
  ~disabled_service() override = default;

  result< bool > quota_reached( const std::optional< request_context >& ctx, const std::string& target ) override;
  result< bool > check_quota_reached( const std::string& target,
                                      const std::optional< scope_parameters >& params,
                                      std::stop_token stop ) override;
  result< std::vector< quota_status > >
  get( const std::string& scope_name, std::int64_t id, std::stop_token stop ) override;
  std::error_code update( const update_quota_command& cmd ) override;
  std::error_code delete_by_user( std::int64_t user_id ) override;
  std::error_code add_reporter( reporter_registration registration ) override;
};

} // namespace gatekeeper::quota
