#pragma once

#include <expected>
#include <system_error>

namespace gatekeeper::quota {

enum class quota_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  disabled,
  invalid_scope,
  invalid_target,
  invalid_target_service,
  target_service_conflict,
  usage_unavailable,
  invalid_tag_format,
  invalid_registration,
  usage_reporter_failed
};

const std::error_category& quota_category() noexcept;

std::error_code make_error_code( quota_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace gatekeeper::quota

template<>
struct std::is_error_code_enum< gatekeeper::quota::quota_errc >: public std::true_type
{};
