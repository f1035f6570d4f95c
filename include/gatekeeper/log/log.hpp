#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <gatekeeper/log/formatter.hpp>
#include <gatekeeper/log/frontend.hpp>

namespace gatekeeper::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Set the root logger level from its textual name ("trace_l1" ... "critical").
 *
 * Returns false and leaves the level untouched if the name is not recognized.
 */
bool set_level( std::string_view level ) noexcept;

} // namespace gatekeeper::log
