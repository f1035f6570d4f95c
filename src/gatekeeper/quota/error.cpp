#include <gatekeeper/quota/error.hpp>
#include <string>
#include <utility>

namespace gatekeeper::quota {

struct _quota_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "quota";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< quota_errc >( condition ) )
    {
      case quota_errc::ok:
        return "ok"s;
      case quota_errc::disabled:
        return "quota is disabled"s;
      case quota_errc::invalid_scope:
        return "invalid quota scope"s;
      case quota_errc::invalid_target:
        return "unknown quota target"s;
      case quota_errc::invalid_target_service:
        return "unknown quota target service"s;
      case quota_errc::target_service_conflict:
        return "target service already registered"s;
      case quota_errc::usage_unavailable:
        return "no usage reported for target"s;
      case quota_errc::invalid_tag_format:
        return "invalid quota tag format"s;
      case quota_errc::invalid_registration:
        return "invalid usage reporter registration"s;
      case quota_errc::usage_reporter_failed:
        return "usage reporter failed"s;
    }
    std::unreachable();
  }
};

const std::error_category& quota_category() noexcept
{
  static _quota_category category;
  return category;
}

std::error_code make_error_code( quota_errc e )
{
  return std::error_code( static_cast< int >( e ), quota_category() );
}

} // namespace gatekeeper::quota
