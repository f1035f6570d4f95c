#pragma once

#include <compare>
#include <string>
#include <string_view>

#include <gatekeeper/quota/error.hpp>
#include <gatekeeper/quota/scope.hpp>

namespace gatekeeper::quota {

/**
 * A tag identifies a single limit or usage entry.
 *
 * It encodes the owning service, the target resource and the scope as
 * "<service>:<target>:<scope>". Tags built with make_tag() are always well
 * formed. Tags that arrive as text (configuration, persistence) are wrapped
 * with from_string() and are only validated when decomposed.
 */
class tag final
{
public:
  tag() = default;

  static tag from_string( std::string text );

  const std::string& str() const noexcept
  {
    return _text;
  }

  result< std::string > service() const;
  result< std::string > target() const;
  result< scope > get_scope() const;

  auto operator<=>( const tag& ) const = default;
  bool operator==( const tag& ) const  = default;

private:
  explicit tag( std::string text );

  std::string _text;
};

constexpr char tag_separator = ':';

result< tag > make_tag( std::string_view service, std::string_view target, scope s );

} // namespace gatekeeper::quota
