#include <gatekeeper/quota/usage_aggregator.hpp>

#include <gatekeeper/log.hpp>

#include <exception>
#include <mutex>
#include <optional>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace gatekeeper::quota {

namespace {

class first_error final
{
public:
  explicit first_error( std::stop_source& source ):
      _source( source )
  {}

  // A failure without an error code is still a failure
  void set( const std::error_code& ec )
  {
    std::lock_guard< std::mutex > lock( _mutex );
    if( !_failed )
    {
      _failed = true;
      _ec     = ec ? ec : make_error_code( quota_errc::usage_reporter_failed );
      _source.request_stop();
    }
  }

  std::optional< std::error_code > get() const
  {
    std::lock_guard< std::mutex > lock( _mutex );
    if( !_failed )
      return {};

    return _ec;
  }

private:
  std::stop_source& _source;
  std::error_code _ec;
  bool _failed = false;
  mutable std::mutex _mutex;
};

} // namespace

usage_aggregator::usage_aggregator( const reporter_registry& registry ):
    _registry( registry )
{}

result< usage_map > usage_aggregator::aggregate( const std::optional< scope_parameters >& params,
                                                 std::stop_token stop ) const
{
  usage_map usage;

  auto reporters = _registry.snapshot();
  if( reporters.empty() )
    return usage;

  std::stop_source source;
  std::stop_callback forward_stop( stop,
                                   [ &source ]()
                                   {
                                     source.request_stop();
                                   } );

  first_error error( source );

  boost::asio::thread_pool pool( reporters.size() );

  for( const auto& entry: reporters )
  {
    boost::asio::post(
      pool,
      [ &entry, &params, &source, &error, &usage ]()
      {
        const auto& [ service, reporter ] = entry;

        if( source.stop_requested() )
          return;

        try
        {
          auto partial = reporter( source.get_token(), params );
          if( !partial )
          {
            LOG_WARNING( gatekeeper::log::instance(),
                         "Usage reporter for service '{}' failed: {}",
                         service,
                         partial.error().message() );
            error.set( partial.error() );
            return;
          }

          if( source.stop_requested() )
            return;

          usage.merge( *partial );
        }
        catch( const std::exception& e )
        {
          LOG_ERROR( gatekeeper::log::instance(), "Usage reporter for service '{}' threw: {}", service, e.what() );
          error.set( quota_errc::usage_reporter_failed );
        }
        catch( ... )
        {
          LOG_ERROR( gatekeeper::log::instance(), "Usage reporter for service '{}' threw an unknown exception", service );
          error.set( quota_errc::usage_reporter_failed );
        }
      } );
  }

  pool.join();

  if( auto ec = error.get(); ec )
    return std::unexpected( *ec );

  if( stop.stop_requested() )
    return std::unexpected( std::make_error_code( std::errc::operation_canceled ) );

  return usage;
}

} // namespace gatekeeper::quota
