// NOLINTBEGIN

#include <gtest/gtest.h>

#include <gatekeeper/store/memory_store.hpp>

using gatekeeper::quota::scope;
using gatekeeper::quota::scope_parameters;
using gatekeeper::quota::tag;
using gatekeeper::quota::update_quota_command;
using gatekeeper::store::memory_store;
using gatekeeper::store::store_errc;

namespace {

tag make_test_tag( const std::string& service, const std::string& target, scope s )
{
  auto t = gatekeeper::quota::make_tag( service, target, s );
  if( !t )
    ADD_FAILURE() << t.error().message();

  return t.value_or( tag{} );
}

update_quota_command make_command( const std::string& target, std::int64_t limit, std::int64_t org_id, std::int64_t user_id )
{
  update_quota_command cmd;
  cmd.target  = target;
  cmd.limit   = limit;
  cmd.org_id  = org_id;
  cmd.user_id = user_id;
  return cmd;
}

} // namespace

TEST( memory_store, scoped_reads )
{
  memory_store store;

  auto global_tag = make_test_tag( "alpha", "a", scope::global );
  auto org_tag    = make_test_tag( "alpha", "a", scope::org );
  auto user_tag   = make_test_tag( "alpha", "a", scope::user );

  ASSERT_FALSE( store.update( global_tag, make_command( "a", 100, 0, 0 ) ) );
  ASSERT_FALSE( store.update( org_tag, make_command( "a", 10, 1, 0 ) ) );
  ASSERT_FALSE( store.update( org_tag, make_command( "a", 20, 2, 0 ) ) );
  ASSERT_FALSE( store.update( user_tag, make_command( "a", 3, 0, 5 ) ) );
  EXPECT_EQ( store.size(), 4 );

  auto limits = store.get( std::nullopt );
  ASSERT_TRUE( limits.has_value() );
  EXPECT_EQ( limits->size(), 1 );
  EXPECT_EQ( limits->get( global_tag ), 100 );

  limits = store.get( scope_parameters{ .org_id = 2 } );
  ASSERT_TRUE( limits.has_value() );
  EXPECT_EQ( limits->size(), 2 );
  EXPECT_EQ( limits->get( org_tag ), 20 );

  limits = store.get( scope_parameters{ .org_id = 1, .user_id = 5 } );
  ASSERT_TRUE( limits.has_value() );
  EXPECT_EQ( limits->size(), 3 );
  EXPECT_EQ( limits->get( org_tag ), 10 );
  EXPECT_EQ( limits->get( user_tag ), 3 );

  limits = store.get( scope_parameters{ .org_id = 3, .user_id = 6 } );
  ASSERT_TRUE( limits.has_value() );
  EXPECT_EQ( limits->size(), 1 );
}

TEST( memory_store, update_is_idempotent )
{
  memory_store store;
  auto org_tag = make_test_tag( "alpha", "a", scope::org );

  ASSERT_FALSE( store.update( org_tag, make_command( "a", 10, 1, 0 ) ) );
  ASSERT_FALSE( store.update( org_tag, make_command( "a", 10, 1, 0 ) ) );
  EXPECT_EQ( store.size(), 1 );

  ASSERT_FALSE( store.update( org_tag, make_command( "a", 11, 1, 0 ) ) );
  EXPECT_EQ( store.size(), 1 );
  EXPECT_EQ( store.get( scope_parameters{ .org_id = 1 } )->get( org_tag ), 11 );
}

TEST( memory_store, invalid_updates )
{
  memory_store store;
  auto org_tag = make_test_tag( "alpha", "a", scope::org );

  EXPECT_EQ( store.update( org_tag, make_command( "a", 1, -1, 0 ) ), store_errc::invalid_command );
  EXPECT_EQ( store.update( org_tag, make_command( "a", 1, 0, 1 ) ), store_errc::invalid_command );
  EXPECT_EQ( store.update( org_tag, make_command( "b", 1, 1, 0 ) ), store_errc::invalid_tag );
  EXPECT_EQ( store.update( tag::from_string( "alpha:a" ), make_command( "a", 1, 1, 0 ) ), store_errc::invalid_tag );
  EXPECT_EQ( store.size(), 0 );
}

TEST( memory_store, delete_by_user )
{
  memory_store store;

  auto org_tag    = make_test_tag( "alpha", "a", scope::org );
  auto user_tag_a = make_test_tag( "alpha", "a", scope::user );
  auto user_tag_b = make_test_tag( "beta", "b", scope::user );

  ASSERT_FALSE( store.update( org_tag, make_command( "a", 10, 5, 0 ) ) );
  ASSERT_FALSE( store.update( user_tag_a, make_command( "a", 1, 0, 5 ) ) );
  ASSERT_FALSE( store.update( user_tag_b, make_command( "b", 2, 0, 5 ) ) );
  ASSERT_FALSE( store.update( user_tag_a, make_command( "a", 3, 0, 6 ) ) );

  ASSERT_FALSE( store.delete_by_user( 5 ) );
  EXPECT_EQ( store.size(), 2 );

  auto limits = store.get( scope_parameters{ .org_id = 5, .user_id = 5 } );
  ASSERT_TRUE( limits.has_value() );
  EXPECT_EQ( limits->size(), 1 );
  EXPECT_EQ( limits->get( org_tag ), 10 );

  EXPECT_EQ( store.get( scope_parameters{ .user_id = 6 } )->get( user_tag_a ), 3 );

  ASSERT_FALSE( store.delete_by_user( 5 ) );
  EXPECT_EQ( store.delete_by_user( 0 ), store_errc::invalid_command );
}

// NOLINTEND
