#pragma once

#include "frontier/core/Types.h"
#include "frontier/sim/GameDate.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace frontier::sim {

enum class EventCategory : core::u8 {
  Trail = 0, // arrivals, end of trail
  Wild,
  Vehicle,
  Person,
  Weather,
};

std::string_view toString(EventCategory category);

// Something that happened during the journey, stamped with the game date.
struct EventHistoryItem {
  EventCategory category{EventCategory::Trail};
  std::string name;
  std::string detail;
  GameDate timestamp{};
};

class EventHistory {
public:
  void add(EventHistoryItem item) { m_items.push_back(std::move(item)); }

  const std::vector<EventHistoryItem>& items() const { return m_items; }
  std::size_t size() const { return m_items.size(); }
  bool empty() const { return m_items.empty(); }

  // nullptr when nothing has happened yet.
  const EventHistoryItem* latest() const { return m_items.empty() ? nullptr : &m_items.back(); }

  std::size_t countOf(EventCategory category) const;

  void clear() { m_items.clear(); }

private:
  std::vector<EventHistoryItem> m_items;
};

} // namespace frontier::sim
