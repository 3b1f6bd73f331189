#include "frontier/sim/Location.h"

#include <utility>

namespace frontier::sim {

std::string_view toString(LocationStatus status) {
  switch (status) {
    case LocationStatus::Unvisited: return "unvisited";
    case LocationStatus::Arrived:   return "arrived";
    case LocationStatus::Departed:  return "departed";
  }
  return "unknown";
}

Location::Location(std::string name, ModeId mode, std::vector<Location> skipChoices)
    : m_name(std::move(name)), m_mode(mode), m_skipChoices(std::move(skipChoices)) {}

bool Location::setArrivalFlag() {
  if (m_status != LocationStatus::Unvisited) return false;
  m_status = LocationStatus::Arrived;
  return true;
}

bool Location::setDepartedFlag() {
  if (m_status != LocationStatus::Arrived) return false;
  m_status = LocationStatus::Departed;
  return true;
}

} // namespace frontier::sim
