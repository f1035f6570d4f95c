// NOLINTBEGIN

#include <gtest/gtest.h>

#include <gatekeeper/quota/tag.hpp>

using gatekeeper::quota::quota_errc;
using gatekeeper::quota::scope;

TEST( tag, compose )
{
  auto t = gatekeeper::quota::make_tag( "dashboards", "dashboard", scope::org );
  ASSERT_TRUE( t.has_value() );

  EXPECT_EQ( t->str(), "dashboards:dashboard:org" );
  EXPECT_EQ( t->service().value(), "dashboards" );
  EXPECT_EQ( t->target().value(), "dashboard" );
  EXPECT_EQ( t->get_scope().value(), scope::org );
}

TEST( tag, rejects_invalid_components )
{
  EXPECT_EQ( gatekeeper::quota::make_tag( "", "dashboard", scope::org ).error(), quota_errc::invalid_tag_format );
  EXPECT_EQ( gatekeeper::quota::make_tag( "dashboards", "", scope::org ).error(), quota_errc::invalid_tag_format );
  EXPECT_EQ( gatekeeper::quota::make_tag( "dash:boards", "dashboard", scope::org ).error(),
             quota_errc::invalid_tag_format );
  EXPECT_EQ( gatekeeper::quota::make_tag( "dashboards", "dash:board", scope::user ).error(),
             quota_errc::invalid_tag_format );
}

TEST( tag, malformed_text )
{
  for( const auto* text: { "", "dashboards", "dashboards:dashboard", "dashboards:dashboard:org:extra", ":dashboard:org",
                           "dashboards::org", "dashboards:dashboard:" } )
  {
    auto t = gatekeeper::quota::tag::from_string( text );
    EXPECT_EQ( t.service().error(), quota_errc::invalid_tag_format ) << text;
    EXPECT_EQ( t.target().error(), quota_errc::invalid_tag_format ) << text;
    EXPECT_EQ( t.get_scope().error(), quota_errc::invalid_tag_format ) << text;
  }
}

TEST( tag, unknown_scope )
{
  auto t = gatekeeper::quota::tag::from_string( "dashboards:dashboard:galaxy" );

  EXPECT_EQ( t.service().value(), "dashboards" );
  EXPECT_EQ( t.target().value(), "dashboard" );
  EXPECT_EQ( t.get_scope().error(), quota_errc::invalid_scope );
}

TEST( tag, ordering )
{
  auto a = gatekeeper::quota::make_tag( "alpha", "a", scope::global ).value();
  auto b = gatekeeper::quota::make_tag( "alpha", "b", scope::global ).value();
  auto c = gatekeeper::quota::make_tag( "beta", "a", scope::global ).value();

  EXPECT_LT( a, b );
  EXPECT_LT( b, c );
  EXPECT_EQ( a, gatekeeper::quota::tag::from_string( "alpha:a:global" ) );
}

// NOLINTEND
