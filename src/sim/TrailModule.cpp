#include "frontier/sim/TrailModule.h"

#include "frontier/core/Log.h"

#include <algorithm>
#include <string>
#include <utility>

namespace frontier::sim {

TrailModule::TrailModule(Trail trail, std::unique_ptr<DistancePolicy> policy) {
  load(std::move(trail), std::move(policy));
}

void TrailModule::load(Trail trail, std::unique_ptr<DistancePolicy> policy) {
  m_trail = std::move(trail);
  m_policy = policy ? std::move(policy) : std::make_unique<FixedDistancePolicy>();

  // Start on the first location with nothing left to drive so the first tick
  // triggers the arrival there.
  m_locationIndex = 0;
  m_distanceToNextLocation = 0;
  m_nextLegDistance = 0;
  m_distanceGenerated = 0;
}

void TrailModule::destroy() {
  m_trail = Trail{};
  m_policy.reset();
  m_locationIndex = 0;
  m_distanceToNextLocation = 0;
  m_nextLegDistance = 0;
  m_distanceGenerated = 0;
}

TrailTickResult TrailModule::onTick(bool systemTick, Vehicle& vehicle, core::u32 totalTurns) {
  (void)systemTick;
  if (!loaded()) return {};

  const int before = m_distanceToNextLocation;
  int remaining = before - vehicle.mileage();

  TrailTickResult result{};
  if (remaining <= 0) {
    result = arriveAtNextLocation(vehicle, totalTurns);
    remaining = 0;
  }

  result.distanceCovered = before - remaining;
  vehicle.addOdometer(result.distanceCovered);
  m_distanceToNextLocation = remaining;
  return result;
}

TrailTickResult TrailModule::arriveAtNextLocation(Vehicle& vehicle, core::u32 totalTurns) {
  TrailTickResult result{};
  if (!loaded() || finished()) return result;

  // The very first tick arrives at the starting location without moving on.
  if (totalTurns > 0) ++m_locationIndex;

  if (m_locationIndex >= m_trail.locations.size()) {
    m_locationIndex = m_trail.locations.size();
    m_nextLegDistance = 0;
    result.endOfGame = true;
    result.requestedMode = ModeId::EndGame;
    FRONTIER_LOG_INFO("Trail: reached the end of '" + m_trail.name + "'");
    return result;
  }

  Location& loc = m_trail.locations[m_locationIndex];
  if (!loc.setArrivalFlag()) return result;

  vehicle.park();
  m_nextLegDistance = generateDistanceToNextLocation();

  result.arrived = true;
  result.requestedMode = loc.mode();
  result.locationName = loc.name();

  FRONTIER_LOG_INFO("Trail: arrived at " + loc.name() + " (index "
                    + std::to_string(m_locationIndex) + ", next leg "
                    + std::to_string(m_nextLegDistance) + " mi)");
  return result;
}

bool TrailModule::departCurrentLocation() {
  Location* loc = currentLocation();
  if (!loc) return false;

  if (!loc->setDepartedFlag()) {
    FRONTIER_LOG_DEBUG("Trail: depart ignored at " + loc->name() + " ("
                       + std::string(toString(loc->status())) + ")");
    return false;
  }

  m_distanceToNextLocation = m_nextLegDistance;
  return true;
}

bool TrailModule::insertLocation(Location location) {
  if (!loaded() || finished()) return false;

  const auto at = m_trail.locations.begin() + static_cast<std::ptrdiff_t>(m_locationIndex + 1);
  FRONTIER_LOG_DEBUG("Trail: inserting " + location.name() + " after "
                     + m_trail.locations[m_locationIndex].name());
  m_trail.locations.insert(at, std::move(location));
  return true;
}

const Location* TrailModule::currentLocation() const {
  if (!loaded() || finished()) return nullptr;
  return &m_trail.locations[m_locationIndex];
}

Location* TrailModule::currentLocation() {
  if (!loaded() || finished()) return nullptr;
  return &m_trail.locations[m_locationIndex];
}

const Location* TrailModule::nextLocation() const {
  const std::size_t next = m_locationIndex + 1;
  if (next >= m_trail.locations.size()) return nullptr;
  return &m_trail.locations[next];
}

bool TrailModule::reachedNextPoint(const Vehicle& vehicle) const {
  const Location* loc = currentLocation();
  return loc && loc->arrived() && vehicle.parked();
}

bool TrailModule::isFirstLocation(const Vehicle& vehicle, core::u32 totalTurns) const {
  return loaded() && m_locationIndex == 0 && totalTurns == 0 && vehicle.parked();
}

int TrailModule::generateDistanceToNextLocation() {
  const int budget = std::max(0, m_trail.trailLength - m_distanceGenerated);
  const int legs = std::max<int>(1, static_cast<int>(m_trail.locations.size() - m_locationIndex) - 1);

  // Once the budget is spent the remaining legs are zero length.
  const int distance = std::clamp(m_policy->nextDistance(budget, legs), budget > 0 ? 1 : 0, budget);
  m_distanceGenerated += distance;
  return distance;
}

} // namespace frontier::sim
