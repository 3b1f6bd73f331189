#pragma once

#include "frontier/core/Types.h"
#include "frontier/sim/Mode.h"

#include <string>
#include <string_view>
#include <vector>

namespace frontier::sim {

enum class LocationStatus : core::u8 {
  Unvisited = 0,
  Arrived,
  Departed,
};

std::string_view toString(LocationStatus status);

// A point of interest on the trail.
//
// Status only moves forward: Unvisited -> Arrived -> Departed.
// Skip choices are the alternate stops offered when the trail forks here; they
// are authored with the trail and copied into the route when picked.
class Location {
public:
  Location() = default;
  explicit Location(std::string name,
                    ModeId mode = ModeId::Travel,
                    std::vector<Location> skipChoices = {});

  const std::string& name() const { return m_name; }
  LocationStatus status() const { return m_status; }
  ModeId mode() const { return m_mode; }
  const std::vector<Location>& skipChoices() const { return m_skipChoices; }

  bool arrived() const { return m_status == LocationStatus::Arrived; }
  bool departed() const { return m_status == LocationStatus::Departed; }

  // Returns false and leaves the status untouched if the move is not forward by one step.
  bool setArrivalFlag();
  bool setDepartedFlag();

private:
  std::string m_name;
  LocationStatus m_status{LocationStatus::Unvisited};
  ModeId m_mode{ModeId::Travel};
  std::vector<Location> m_skipChoices;
};

} // namespace frontier::sim
