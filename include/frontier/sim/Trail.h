#pragma once

#include "frontier/sim/Location.h"

#include <string>
#include <vector>

namespace frontier::sim {

// Ordered stops (visit order) plus a ceiling on the miles generated between them.
struct Trail {
  std::string name;
  std::vector<Location> locations;
  int trailLength{0};
};

} // namespace frontier::sim
