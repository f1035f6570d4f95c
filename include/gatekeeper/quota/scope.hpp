#pragma once

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string_view>

#include <gatekeeper/quota/error.hpp>

namespace gatekeeper::quota {

enum class scope : std::uint8_t
{
  global,
  org,
  user
};

constexpr std::string_view to_string( scope s ) noexcept
{
  switch( s )
  {
    case scope::global:
      return "global";
    case scope::org:
      return "org";
    case scope::user:
      return "user";
  }

  return "unknown";
}

result< scope > scope_from_string( std::string_view text );

/**
 * Identifies the organization and user a quota decision is made for.
 *
 * A zero id means the corresponding scope is not applicable.
 */
struct scope_parameters
{
  std::int64_t org_id  = 0;
  std::int64_t user_id = 0;

  bool operator==( const scope_parameters& ) const = default;
};

/**
 * Returns true if limits of scope s can be evaluated with the given parameters.
 *
 * Global limits always apply. Organization and user limits only apply when the
 * matching id is present.
 */
bool applicable( scope s, const std::optional< scope_parameters >& params ) noexcept;

/**
 * The caller-derived part of an inbound request.
 */
struct request_context
{
  std::int64_t org_id  = 0;
  std::int64_t user_id = 0;
  bool signed_in       = false;
  std::stop_token stop;
};

} // namespace gatekeeper::quota
