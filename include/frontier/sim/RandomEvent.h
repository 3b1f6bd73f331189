#pragma once

#include "frontier/core/Random.h"
#include "frontier/core/Types.h"
#include "frontier/sim/EventHistory.h"

#include <functional>
#include <string>
#include <vector>

namespace frontier::sim {

struct SimulationContext;

// Something that may happen on the road during a travel turn.
// The action applies the consequences and returns the text shown to the player.
struct RandomEvent {
  std::string name;
  EventCategory category{EventCategory::Wild};
  double rollChance{0.0}; // per travel turn, before the global scale
  core::u32 rollCount{0}; // times this event has fired
  std::function<std::string(SimulationContext&)> action;
};

// Oxen, thieves, wheels, fog and fruit.
std::vector<RandomEvent> defaultRandomEvents();

// Rolls the event table once per travel turn. At most one event fires per roll;
// the table is checked in order and the first hit wins.
class RandomEventDirector {
public:
  RandomEventDirector() = default;
  RandomEventDirector(std::vector<RandomEvent> events, core::u64 seed, double chanceScale = 1.0);

  // Fires at most one event, records it in ctx.history and returns it.
  // Returns nullptr when nothing happened.
  const RandomEvent* roll(SimulationContext& ctx);

  const std::vector<RandomEvent>& events() const { return m_events; }
  double chanceScale() const { return m_chanceScale; }

private:
  std::vector<RandomEvent> m_events;
  core::SplitMix64 m_rng;
  double m_chanceScale{1.0};
};

} // namespace frontier::sim
