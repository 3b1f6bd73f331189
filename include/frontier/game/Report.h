#pragma once

#include "frontier/core/JsonWriter.h"

#include <string>

namespace frontier::game {

class Simulation;

// Snapshot of a running simulation: trail progress, locations, inventory and
// event history. Writes nothing useful for a simulation that is not running.
void writeReportJson(core::JsonWriter& j, const Simulation& simulation);

bool writeReportFile(const Simulation& simulation, const std::string& path, std::string* outError = nullptr);

} // namespace frontier::game
