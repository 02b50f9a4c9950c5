#pragma once

// ResidentCore - Live object tracking for a persistence session
//
// Usage:
//   #include <ResidentCore.hpp>
//
//   auto registry = resident::live_registry::create();
//   auto scope = registry->new_scope();
//
//   auto trip = std::make_shared<Trip>();
//   registry->insert_pairs({{resident::entry::make("trip-1", loaded_json), trip}});
//
//   registry->id_to_object("trip-1");   // trip, for as long as scope is open
//   scope.reset();                        // trip is released and forgotten

#include "resident/log.hpp"
#include "resident/types.hpp"
#include "resident/errors.hpp"
#include "resident/guard.hpp"
#include "resident/entry.hpp"
#include "resident/scope.hpp"
#include "resident/configuration.hpp"
#include "resident/registry.hpp"
