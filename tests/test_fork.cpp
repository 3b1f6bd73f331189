#include "frontier/game/ForkForms.h"
#include "frontier/sim/SimulationContext.h"

#include <iostream>
#include <memory>
#include <string>
#include <utility>

using namespace frontier;

namespace {
void startAtFork(sim::SimulationContext& ctx) {
  sim::Trail t{};
  t.name = "fork";
  t.trailLength = 500;
  t.locations = {
    sim::Location("Crossroads", sim::ModeId::ForkInRoad, {sim::Location("S1"), sim::Location("S2")}),
    sim::Location("Valley"),
  };
  ctx.trail.load(std::move(t), std::make_unique<sim::FixedDistancePolicy>(40));
  ctx.vehicle.setMileage(10);
  ctx.trail.onTick(false, ctx.vehicle, 0);
}
} // namespace

int test_fork() {
  int fails = 0;

  // Rendering and ignored input.
  {
    sim::SimulationContext ctx;
    startAtFork(ctx);

    game::LocationFork fork(ctx);
    fork.onFormPostCreate();

    if (fork.skipChoices().size() != 2 || fork.skipChoices().at(1).name() != "S1"
        || fork.skipChoices().at(2).name() != "S2") {
      std::cerr << "[test_fork] skip choices should be numbered from 1\n";
      ++fails;
    }

    const std::string expected =
      "\nThe trail divides here. You may:\n\n  1. head for S1\n  2. head for S2\n  3. see the map";
    if (fork.render() != expected) {
      std::cerr << "[test_fork] fork text mismatch:\n" << fork.render() << "\n";
      ++fails;
    }

    for (const char* in : {"abc", "0", "-2", "", "1.5"}) {
      if (fork.onInput(in).kind != game::TransitionKind::None) {
        std::cerr << "[test_fork] input '" << in << "' should be ignored\n";
        ++fails;
      }
    }
    if (ctx.trail.locations().size() != 2) {
      std::cerr << "[test_fork] ignored input changed the route\n";
      ++fails;
    }

    for (const char* in : {"3", "7"}) {
      const auto t = fork.onInput(in);
      if (t.kind != game::TransitionKind::SetForm || t.form != game::FormId::LookAtMap) {
        std::cerr << "[test_fork] input '" << in << "' should open the map\n";
        ++fails;
      }
    }
    if (ctx.trail.locations().size() != 2) {
      std::cerr << "[test_fork] map request changed the route\n";
      ++fails;
    }
  }

  // Picking a branch splices it in, then departing leaves the fork.
  {
    sim::SimulationContext ctx;
    startAtFork(ctx);

    game::LocationFork fork(ctx);
    fork.onFormPostCreate();

    const auto t = fork.onInput(" 1 ");
    if (t.kind != game::TransitionKind::SetForm || t.form != game::FormId::LocationDepart) {
      std::cerr << "[test_fork] choice 1 should go to LocationDepart\n";
      ++fails;
    }
    const auto& locs = ctx.trail.locations();
    if (locs.size() != 3 || locs[1].name() != "S1" || locs[2].name() != "Valley") {
      std::cerr << "[test_fork] S1 should be inserted after the fork\n";
      ++fails;
    }

    game::LocationDepart depart(ctx);
    const std::string expected =
      "\nYou decide to head for S1.\nIt is 40 miles away.\n\nPress ENTER KEY to continue\n";
    if (depart.render() != expected) {
      std::cerr << "[test_fork] depart text mismatch:\n" << depart.render() << "\n";
      ++fails;
    }

    const auto d = depart.onInput("");
    if (d.kind != game::TransitionKind::RemoveMode) {
      std::cerr << "[test_fork] departing should remove the fork mode\n";
      ++fails;
    }
    if (ctx.vehicle.parked() || ctx.trail.locations()[0].status() != sim::LocationStatus::Departed
        || ctx.trail.distanceToNextLocation() != 40) {
      std::cerr << "[test_fork] departing should put the wagon on the 40 mile leg\n";
      ++fails;
    }

    // Four turns of 10 miles reach the chosen branch.
    for (frontier::core::u32 turn = 1; turn <= 4; ++turn) {
      ctx.trail.onTick(false, ctx.vehicle, turn);
    }
    if (ctx.trail.currentLocation() == nullptr || ctx.trail.currentLocation()->name() != "S1") {
      std::cerr << "[test_fork] wagon should arrive at S1\n";
      ++fails;
    }
  }

  // A fork with no current location offers only the map.
  {
    sim::SimulationContext ctx;
    game::LocationFork fork(ctx);
    fork.onFormPostCreate();
    if (!fork.skipChoices().empty() || fork.render().find("  1. see the map") == std::string::npos) {
      std::cerr << "[test_fork] empty fork should only offer the map\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_fork] pass\n";
  return fails;
}
