#include <gatekeeper/quota/limit_resolver.hpp>

namespace gatekeeper::quota {

limit_resolver::limit_resolver( const limit_map& defaults, const override_store& store ):
    _defaults( defaults ),
    _store( store )
{}

result< std::map< tag, std::int64_t > > limit_resolver::resolve( const std::string& service,
                                                                 const std::optional< scope_parameters >& params ) const
{
  auto overrides = _store.get( params );
  if( !overrides )
    return std::unexpected( overrides.error() );

  std::map< tag, std::int64_t > limits;

  for( const auto& [ t, default_limit ]: _defaults.entries() )
  {
    auto owner = t.service();
    if( !owner )
      return std::unexpected( owner.error() );

    if( *owner != service )
      continue;

    auto s = t.get_scope();
    if( !s )
      return std::unexpected( s.error() );

    if( !applicable( *s, params ) )
      continue;

    limits.emplace( t, overrides->get( t ).value_or( default_limit ) );
  }

  return limits;
}

} // namespace gatekeeper::quota
