#include "frontier/sim/EventHistory.h"

#include <algorithm>

namespace frontier::sim {

std::string_view toString(EventCategory category) {
  switch (category) {
    case EventCategory::Trail:   return "trail";
    case EventCategory::Wild:    return "wild";
    case EventCategory::Vehicle: return "vehicle";
    case EventCategory::Person:  return "person";
    case EventCategory::Weather: return "weather";
  }
  return "unknown";
}

std::size_t EventHistory::countOf(EventCategory category) const {
  return static_cast<std::size_t>(std::count_if(m_items.begin(), m_items.end(),
      [category](const EventHistoryItem& it) { return it.category == category; }));
}

} // namespace frontier::sim
