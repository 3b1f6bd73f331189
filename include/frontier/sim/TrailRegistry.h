#pragma once

#include "frontier/sim/Trail.h"

#include <string>
#include <string_view>
#include <vector>

namespace frontier::sim {

// Built-in trails. Each call returns a fresh copy with every location unvisited.
Trail oregonTrail();
Trail fortLaramieTrail();

// Names accepted by loadTrail(), in listing order.
std::vector<std::string_view> trailNames();

bool loadTrail(std::string_view name, Trail& out, std::string* outError = nullptr);

// Structural checks: at least one location, named stops, positive length,
// and every fork offers at least one branch.
bool validateTrail(const Trail& trail, std::string* outError = nullptr);

} // namespace frontier::sim
