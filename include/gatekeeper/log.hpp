#pragma once

#include <gatekeeper/log/log.hpp>
