#include <gatekeeper/quota/tag.hpp>

#include <array>
#include <utility>

namespace gatekeeper::quota {

namespace {

struct components
{
  std::string_view service;
  std::string_view target;
  std::string_view scope;
};

result< components > split( std::string_view text )
{
  std::array< std::string_view, 3 > parts;
  std::size_t index = 0;

  while( index < parts.size() )
  {
    auto pos = text.find( tag_separator );
    if( index == parts.size() - 1 )
    {
      if( pos != std::string_view::npos )
        return std::unexpected( quota_errc::invalid_tag_format );

      parts[ index++ ] = text;
      break;
    }

    if( pos == std::string_view::npos )
      return std::unexpected( quota_errc::invalid_tag_format );

    parts[ index++ ] = text.substr( 0, pos );
    text.remove_prefix( pos + 1 );
  }

  for( const auto& part: parts )
    if( part.empty() )
      return std::unexpected( quota_errc::invalid_tag_format );

  return components{ parts[ 0 ], parts[ 1 ], parts[ 2 ] };
}

bool valid_component( std::string_view component ) noexcept
{
  return !component.empty() && component.find( tag_separator ) == std::string_view::npos;
}

} // namespace

tag::tag( std::string text ):
    _text( std::move( text ) )
{}

tag tag::from_string( std::string text )
{
  return tag( std::move( text ) );
}

result< std::string > tag::service() const
{
  return split( _text ).transform(
    []( const components& c )
    {
      return std::string( c.service );
    } );
}

result< std::string > tag::target() const
{
  return split( _text ).transform(
    []( const components& c )
    {
      return std::string( c.target );
    } );
}

result< scope > tag::get_scope() const
{
  return split( _text ).and_then(
    []( const components& c )
    {
      return scope_from_string( c.scope );
    } );
}

result< tag > make_tag( std::string_view service, std::string_view target, scope s )
{
  if( !valid_component( service ) || !valid_component( target ) )
    return std::unexpected( quota_errc::invalid_tag_format );

  std::string text;
  text.reserve( service.size() + target.size() + to_string( s ).size() + 2 );
  text.append( service );
  text.push_back( tag_separator );
  text.append( target );
  text.push_back( tag_separator );
  text.append( to_string( s ) );

  return tag::from_string( std::move( text ) );
}

} // namespace gatekeeper::quota
