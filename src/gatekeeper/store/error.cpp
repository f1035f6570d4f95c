#include <gatekeeper/store/error.hpp>
#include <string>
#include <utility>

namespace gatekeeper::store {

struct _store_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "store";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< store_errc >( condition ) )
    {
      case store_errc::ok:
        return "ok"s;
      case store_errc::invalid_command:
        return "invalid quota command"s;
      case store_errc::invalid_tag:
        return "invalid quota tag"s;
    }
    std::unreachable();
  }
};

const std::error_category& store_category() noexcept
{
  static _store_category category;
  return category;
}

std::error_code make_error_code( store_errc e )
{
  return std::error_code( static_cast< int >( e ), store_category() );
}

} // namespace gatekeeper::store
