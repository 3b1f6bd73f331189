#pragma once

#include "frontier/core/Types.h"
#include "frontier/sim/DistancePolicy.h"
#include "frontier/sim/Mode.h"
#include "frontier/sim/Trail.h"
#include "frontier/sim/Vehicle.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace frontier::sim {

// What a tick or an arrival asks the dispatcher to do. The module itself never
// touches the mode stack.
struct TrailTickResult {
  bool arrived{false};   // a location was newly reached this call
  bool endOfGame{false}; // the wagon rolled past the last location
  std::optional<ModeId> requestedMode;
  std::string locationName;
  int distanceCovered{0};
};

// Tracks the wagon's position along a loaded trail.
//
// Index rule: valid locations are [0, count). locationIndex() == count means the
// trail is finished; currentLocation() is then nullptr and arrivals are no-ops.
//
// Two distances are kept: distanceToNextLocation() is what is left of the leg
// being driven (0 while parked), nextLegDistance() is the length of the leg
// generated on arrival, which becomes the driven distance on departure.
class TrailModule {
public:
  TrailModule() = default;
  TrailModule(Trail trail, std::unique_ptr<DistancePolicy> policy);

  // Replaces any loaded trail. A null policy falls back to the fixed one-mile leg.
  void load(Trail trail, std::unique_ptr<DistancePolicy> policy);

  // Clears the trail and counters.
  void destroy();

  bool loaded() const { return !m_trail.locations.empty(); }
  bool finished() const { return loaded() && m_locationIndex >= m_trail.locations.size(); }

  // Subtracts the vehicle mileage from the remaining distance. Reaching zero
  // triggers arriveAtNextLocation() once and parks the distance at 0.
  // systemTick is accepted for parity with the other modules; trail progress
  // does not depend on it.
  TrailTickResult onTick(bool systemTick, Vehicle& vehicle, core::u32 totalTurns);

  // Moves to the next location (only once a turn has elapsed), flags it,
  // parks the vehicle and generates the next leg. Past the last location the
  // trail is finished and EndGame is requested.
  TrailTickResult arriveAtNextLocation(Vehicle& vehicle, core::u32 totalTurns);

  // Flags the current location departed and starts driving the next leg.
  bool departCurrentLocation();

  // Splices `location` right after the current one. Visited history is untouched.
  bool insertLocation(Location location);

  const Location* currentLocation() const;
  Location* currentLocation();
  // nullptr when the current location is the last one (or the trail is finished).
  const Location* nextLocation() const;

  bool reachedNextPoint(const Vehicle& vehicle) const;
  bool isFirstLocation(const Vehicle& vehicle, core::u32 totalTurns) const;

  std::size_t locationIndex() const { return m_locationIndex; }
  int distanceToNextLocation() const { return m_distanceToNextLocation; }
  int nextLegDistance() const { return m_nextLegDistance; }
  int distanceGenerated() const { return m_distanceGenerated; }
  int trailLength() const { return m_trail.trailLength; }
  const std::string& trailName() const { return m_trail.name; }
  const std::vector<Location>& locations() const { return m_trail.locations; }
  const DistancePolicy* distancePolicy() const { return m_policy.get(); }

private:
  int generateDistanceToNextLocation();

  Trail m_trail{};
  std::unique_ptr<DistancePolicy> m_policy;

  std::size_t m_locationIndex{0};
  int m_distanceToNextLocation{0};
  int m_nextLegDistance{0};
  int m_distanceGenerated{0};
};

} // namespace frontier::sim
