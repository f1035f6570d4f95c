#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <gatekeeper/quota/error.hpp>
#include <gatekeeper/quota/scope.hpp>
#include <gatekeeper/quota/tag.hpp>

namespace gatekeeper::quota {

/**
 * quota_map associates tags with integer values.
 *
 * It is used both for limits (negative is unlimited, zero blocks the target,
 * a positive value is a hard ceiling) and for reported usage.
 *
 * All member functions are thread safe. In particular merge() may be called
 * concurrently by several writers folding partial results into one map.
 * Entries are ordered by tag, so entries() is deterministic.
 */
class quota_map final
{
public:
  using entry = std::pair< tag, std::int64_t >;

  quota_map() = default;
  quota_map( std::initializer_list< entry > entries );
  quota_map( const quota_map& other );
  quota_map( quota_map&& other ) noexcept;
  ~quota_map() = default;

  quota_map& operator=( const quota_map& other );
  quota_map& operator=( quota_map&& other ) noexcept;

  void set( const tag& t, std::int64_t value );
  std::optional< std::int64_t > get( const tag& t ) const;

  /**
   * Merge other into this map. Entries of other win on collision.
   */
  void merge( const quota_map& other );

  /**
   * A snapshot of every entry in tag order.
   */
  std::vector< entry > entries() const;

  /**
   * The owning services of every tag. Fails if any tag is malformed.
   */
  result< std::set< std::string > > services() const;

  /**
   * The target resources of every tag. Fails if any tag is malformed.
   */
  result< std::set< std::string > > targets() const;

  result< std::set< scope > > scopes() const;

  std::size_t size() const;
  bool empty() const;

private:
  std::map< tag, std::int64_t > _values;
  mutable std::shared_mutex _mutex;
};

using limit_map = quota_map;
using usage_map = quota_map;

} // namespace gatekeeper::quota
