#include "frontier/sim/TrailRegistry.h"

#include "frontier/core/Log.h"

#include <string>

namespace frontier::sim {

Trail oregonTrail() {
  Trail t{};
  t.name = "oregon";
  t.trailLength = 2040;
  t.locations = {
    Location("Independence"),
    Location("Kansas River Crossing"),
    Location("Big Blue River Crossing"),
    Location("Fort Kearney"),
    Location("Chimney Rock"),
    Location("Fort Laramie"),
    Location("Independence Rock"),
    // Both branches rejoin at Soda Springs.
    Location("South Pass", ModeId::ForkInRoad, {
      Location("Green River Crossing"),
      Location("Fort Bridger"),
    }),
    Location("Soda Springs"),
    Location("Fort Hall"),
    Location("Snake River Crossing"),
    Location("Fort Boise"),
    Location("Blue Mountains", ModeId::ForkInRoad, {
      Location("Fort Walla Walla"),
      Location("Umatilla Agency"),
    }),
    Location("The Dalles"),
    Location("Oregon City", ModeId::EndGame),
  };
  return t;
}

Trail fortLaramieTrail() {
  Trail t{};
  t.name = "fort-laramie";
  t.trailLength = 640;
  t.locations = {
    Location("Independence"),
    Location("Kansas River Crossing"),
    Location("Fort Kearney", ModeId::ForkInRoad, {
      Location("Chimney Rock"),
      Location("Scotts Bluff"),
    }),
    Location("Fort Laramie", ModeId::EndGame),
  };
  return t;
}

std::vector<std::string_view> trailNames() {
  return {"oregon", "fort-laramie"};
}

bool loadTrail(std::string_view name, Trail& out, std::string* outError) {
  if (name == "oregon") {
    out = oregonTrail();
  } else if (name == "fort-laramie") {
    out = fortLaramieTrail();
  } else {
    if (outError) *outError = "unknown trail '" + std::string(name) + "'";
    return false;
  }

  FRONTIER_LOG_DEBUG("TrailRegistry: loaded '" + out.name + "' with "
                     + std::to_string(out.locations.size()) + " locations");
  return validateTrail(out, outError);
}

bool validateTrail(const Trail& trail, std::string* outError) {
  if (trail.locations.empty()) {
    if (outError) *outError = "trail '" + trail.name + "' has no locations";
    return false;
  }
  if (trail.trailLength <= 0) {
    if (outError) *outError = "trail '" + trail.name + "' has no length";
    return false;
  }
  for (const auto& loc : trail.locations) {
    if (loc.name().empty()) {
      if (outError) *outError = "trail '" + trail.name + "' has an unnamed location";
      return false;
    }
    if (loc.mode() == ModeId::ForkInRoad && loc.skipChoices().empty()) {
      if (outError) *outError = "fork at '" + loc.name() + "' has no skip choices";
      return false;
    }
  }
  return true;
}

} // namespace frontier::sim
