#pragma once

#include <gatekeeper/quota/disabled_service.hpp>
#include <gatekeeper/quota/engine.hpp>
#include <gatekeeper/quota/error.hpp>
#include <gatekeeper/quota/map.hpp>
#include <gatekeeper/quota/reporter_registry.hpp>
#include <gatekeeper/quota/scope.hpp>
#include <gatekeeper/quota/service.hpp>
#include <gatekeeper/quota/store.hpp>
#include <gatekeeper/quota/tag.hpp>
#include <gatekeeper/quota/types.hpp>
