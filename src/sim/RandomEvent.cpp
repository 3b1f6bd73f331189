#include "frontier/sim/RandomEvent.h"

#include "frontier/core/Log.h"
#include "frontier/sim/SimulationContext.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace frontier::sim {

std::vector<RandomEvent> defaultRandomEvents() {
  std::vector<RandomEvent> events;

  events.push_back(RandomEvent{"Ox wanders off", EventCategory::Wild, 0.02, 0,
    [](SimulationContext& ctx) -> std::string {
      if (!ctx.vehicle.removeItem(ItemId::Oxen, 1.0)) {
        return "Something spooked the herd, but you have no oxen left to lose.";
      }
      return "One of your oxen wandered off in the night.";
    }});

  events.push_back(RandomEvent{"Thief", EventCategory::Person, 0.02, 0,
    [](SimulationContext& ctx) -> std::string {
      const double stolen = std::floor(ctx.vehicle.quantity(ItemId::Food) * 0.1);
      if (stolen < 1.0 || !ctx.vehicle.removeItem(ItemId::Food, stolen)) {
        return "A thief came during the night but found nothing worth taking.";
      }
      return "A thief came during the night and stole " + std::to_string(static_cast<long long>(stolen))
           + " pounds of food.";
    }});

  events.push_back(RandomEvent{"Broken wagon wheel", EventCategory::Vehicle, 0.02, 0,
    [](SimulationContext& ctx) -> std::string {
      if (ctx.vehicle.removeItem(ItemId::Wheel, 1.0)) {
        return "A wagon wheel broke. You replaced it with your spare.";
      }
      return "A wagon wheel broke. With no spare you patch it as best you can.";
    }});

  events.push_back(RandomEvent{"Heavy fog", EventCategory::Weather, 0.03, 0,
    [](SimulationContext&) -> std::string {
      return "Heavy fog hangs over the trail.";
    }});

  events.push_back(RandomEvent{"Wild fruit", EventCategory::Wild, 0.03, 0,
    [](SimulationContext& ctx) -> std::string {
      ctx.vehicle.addItem(ItemId::Food, 20.0);
      return "You find wild fruit along the trail and gather 20 pounds of food.";
    }});

  return events;
}

RandomEventDirector::RandomEventDirector(std::vector<RandomEvent> events, core::u64 seed, double chanceScale)
    : m_events(std::move(events)), m_rng(seed), m_chanceScale(std::max(0.0, chanceScale)) {}

const RandomEvent* RandomEventDirector::roll(SimulationContext& ctx) {
  if (m_chanceScale <= 0.0) return nullptr;

  for (auto& ev : m_events) {
    if (!m_rng.chance(ev.rollChance * m_chanceScale)) continue;

    ++ev.rollCount;
    std::string detail = ev.action ? ev.action(ctx) : std::string();

    FRONTIER_LOG_INFO("Event: " + ev.name + " on " + formatDate(ctx.date));
    ctx.history.add(EventHistoryItem{ev.category, ev.name, std::move(detail), ctx.date});
    return &ev;
  }
  return nullptr;
}

} // namespace frontier::sim
