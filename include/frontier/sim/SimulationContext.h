#pragma once

#include "frontier/core/Types.h"
#include "frontier/sim/EventHistory.h"
#include "frontier/sim/GameDate.h"
#include "frontier/sim/RandomEvent.h"
#include "frontier/sim/TrailModule.h"
#include "frontier/sim/Vehicle.h"

namespace frontier::sim {

// Everything the forms are allowed to read and write. Passed by reference to
// each form instead of being reachable globally.
struct SimulationContext {
  TrailModule trail;
  Vehicle vehicle;
  GameDate date{};
  EventHistory history;
  RandomEventDirector events;
  core::u32 totalTurns{0};
};

} // namespace frontier::sim
