#pragma once

#include <expected>
#include <system_error>

namespace gatekeeper::store {

enum class store_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_command,
  invalid_tag
};

const std::error_category& store_category() noexcept;

std::error_code make_error_code( store_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace gatekeeper::store

template<>
struct std::is_error_code_enum< gatekeeper::store::store_errc >: public std::true_type
{};
