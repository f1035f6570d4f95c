#pragma once

#include <gatekeeper/store/error.hpp>
#include <gatekeeper/store/memory_store.hpp>
