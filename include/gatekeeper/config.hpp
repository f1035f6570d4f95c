#pragma once

#include <gatekeeper/config/config.hpp>
#include <gatekeeper/config/error.hpp>
