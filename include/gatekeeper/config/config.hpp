#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <gatekeeper/config/error.hpp>
#include <gatekeeper/quota/map.hpp>

namespace gatekeeper::config {

constexpr auto default_log_level = "info";

/**
 * A usage source described entirely by configuration. It contributes default
 * limits like any other service and reports fixed usage counts.
 */
struct static_source
{
  std::string service;
  quota::limit_map defaults;
  quota::usage_map usage;
};

struct config
{
  bool enabled          = false;
  std::string log_level = default_log_level;
  quota::limit_map limits;
  std::vector< static_source > sources;
};

/**
 * Parse a YAML document of the form
 *
 *   quota:
 *     enabled: true
 *     log-level: info
 *     limits:
 *       "<service>:<target>:<scope>": <limit>
 *   sources:
 *     - service: <service>
 *       defaults:
 *         "<service>:<target>:<scope>": <limit>
 *       usage:
 *         "<service>:<target>:<scope>": <used>
 *
 * Every key is optional. Tags must be well formed.
 */
result< config > parse( std::string_view yaml );

result< config > load( const std::filesystem::path& path );

} // namespace gatekeeper::config
