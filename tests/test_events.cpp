#include "frontier/sim/GameDate.h"
#include "frontier/sim/RandomEvent.h"
#include "frontier/sim/SimulationContext.h"

#include <iostream>
#include <string>
#include <vector>

using namespace frontier::sim;

namespace {
std::vector<RandomEvent> alwaysFruit() {
  std::vector<RandomEvent> events;
  events.push_back(RandomEvent{"Wild fruit", EventCategory::Wild, 1.0, 0,
    [](SimulationContext& ctx) -> std::string {
      ctx.vehicle.addItem(ItemId::Food, 20.0);
      return "fruit";
    }});
  events.push_back(RandomEvent{"Never first", EventCategory::Weather, 1.0, 0,
    [](SimulationContext&) -> std::string { return "unreachable"; }});
  return events;
}

std::vector<std::string> rollNames(frontier::core::u64 seed, int turns) {
  SimulationContext ctx;
  ctx.vehicle.addItem(ItemId::Oxen, 6);
  ctx.vehicle.addItem(ItemId::Food, 500);
  ctx.vehicle.addItem(ItemId::Wheel, 1);
  ctx.events = RandomEventDirector(defaultRandomEvents(), seed, 10.0);

  std::vector<std::string> names;
  for (int i = 0; i < turns; ++i) {
    if (const RandomEvent* ev = ctx.events.roll(ctx)) names.push_back(ev->name);
    advanceDay(ctx.date);
  }
  return names;
}
} // namespace

int test_events() {
  int fails = 0;

  // Calendar.
  {
    GameDate d{1848, 2, 28};
    advanceDay(d);
    if (d != GameDate{1848, 2, 29}) {
      std::cerr << "[test_events] 1848 is a leap year\n";
      ++fails;
    }
    GameDate n{1849, 2, 28};
    advanceDay(n);
    if (n != GameDate{1849, 3, 1}) {
      std::cerr << "[test_events] 1849 February has 28 days\n";
      ++fails;
    }
    GameDate y{1848, 12, 31};
    advanceDay(y);
    if (y != GameDate{1849, 1, 1}) {
      std::cerr << "[test_events] year rollover failed\n";
      ++fails;
    }
    if (formatDate(GameDate{}) != "March 1, 1848" || isValidDate(GameDate{1848, 4, 31})
        || !isValidDate(GameDate{1848, 2, 29})) {
      std::cerr << "[test_events] formatDate/isValidDate wrong: " << formatDate(GameDate{}) << "\n";
      ++fails;
    }
  }

  // A certain event fires first, once per roll, and is recorded with the date.
  {
    SimulationContext ctx;
    ctx.date = GameDate{1848, 5, 10};
    ctx.events = RandomEventDirector(alwaysFruit(), 7);

    const RandomEvent* ev = ctx.events.roll(ctx);
    if (!ev || ev->name != "Wild fruit" || ev->rollCount != 1) {
      std::cerr << "[test_events] certain event did not fire\n";
      ++fails;
    }
    if (ctx.events.events()[1].rollCount != 0) {
      std::cerr << "[test_events] only one event may fire per roll\n";
      ++fails;
    }
    if (ctx.vehicle.quantity(ItemId::Food) != 20.0) {
      std::cerr << "[test_events] event action not applied\n";
      ++fails;
    }
    const EventHistoryItem* last = ctx.history.latest();
    if (ctx.history.size() != 1 || !last || last->name != "Wild fruit" || last->detail != "fruit"
        || last->category != EventCategory::Wild || last->timestamp != GameDate{1848, 5, 10}) {
      std::cerr << "[test_events] history entry wrong\n";
      ++fails;
    }
    if (ctx.history.countOf(EventCategory::Wild) != 1 || ctx.history.countOf(EventCategory::Trail) != 0) {
      std::cerr << "[test_events] countOf wrong\n";
      ++fails;
    }
  }

  // Scale 0 disables events entirely.
  {
    SimulationContext ctx;
    ctx.events = RandomEventDirector(alwaysFruit(), 7, 0.0);
    for (int i = 0; i < 20; ++i) {
      if (ctx.events.roll(ctx) != nullptr) {
        std::cerr << "[test_events] disabled director fired an event\n";
        ++fails;
        break;
      }
    }
    if (!ctx.history.empty()) {
      std::cerr << "[test_events] disabled director wrote history\n";
      ++fails;
    }
  }

  // Same seed, same events.
  {
    const auto a = rollNames(99, 200);
    const auto b = rollNames(99, 200);
    if (a != b || a.empty()) {
      std::cerr << "[test_events] rolls are not reproducible (" << a.size() << " vs " << b.size() << ")\n";
      ++fails;
    }
  }

  // Default effects keep the inventory non-negative.
  {
    SimulationContext ctx;
    ctx.events = RandomEventDirector(defaultRandomEvents(), 5, 30.0);
    for (int i = 0; i < 100; ++i) ctx.events.roll(ctx);
    for (const auto& [id, item] : ctx.vehicle.inventory()) {
      if (item.quantity < 0.0) {
        std::cerr << "[test_events] " << item.name << " went negative\n";
        ++fails;
      }
    }
  }

  if (fails == 0) std::cout << "[test_events] pass\n";
  return fails;
}
