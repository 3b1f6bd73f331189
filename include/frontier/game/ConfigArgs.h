#pragma once

#include "frontier/core/Args.h"
#include "frontier/game/Simulation.h"

#include <string>

namespace frontier::game {

// Fills `cfg` from --trail, --seed, --distance, --leg, --mileage and --events,
// keeping the defaults for anything not given, then validates the result.
// A --seed that is not a number is hashed, so any word names a repeatable run.
bool applyArgs(const core::Args& args, SimulationConfig& cfg, std::string* outError = nullptr);

} // namespace frontier::game
