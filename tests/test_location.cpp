#include "frontier/sim/Location.h"
#include "frontier/sim/TrailRegistry.h"

#include <iostream>
#include <string>

int test_location() {
  int fails = 0;

  using namespace frontier::sim;

  // Status only moves forward, one step at a time.
  {
    Location loc("Fort Hall");
    if (loc.status() != LocationStatus::Unvisited || loc.mode() != ModeId::Travel) {
      std::cerr << "[test_location] new location should be unvisited travel stop\n";
      ++fails;
    }
    if (loc.setDepartedFlag()) {
      std::cerr << "[test_location] departed before arriving\n";
      ++fails;
    }
    if (!loc.setArrivalFlag() || !loc.arrived()) {
      std::cerr << "[test_location] arrival flag not set\n";
      ++fails;
    }
    if (loc.setArrivalFlag()) {
      std::cerr << "[test_location] arrival flag set twice\n";
      ++fails;
    }
    if (!loc.setDepartedFlag() || !loc.departed()) {
      std::cerr << "[test_location] departed flag not set\n";
      ++fails;
    }
    if (loc.setArrivalFlag() || loc.setDepartedFlag() || loc.status() != LocationStatus::Departed) {
      std::cerr << "[test_location] status moved backwards after departure\n";
      ++fails;
    }
  }

  // Registry trails are well formed and forks carry their branches.
  for (const auto name : trailNames()) {
    Trail t;
    std::string err;
    if (!loadTrail(name, t, &err)) {
      std::cerr << "[test_location] failed to load '" << name << "': " << err << "\n";
      ++fails;
      continue;
    }
    if (t.name != name) {
      std::cerr << "[test_location] trail name mismatch for '" << name << "'\n";
      ++fails;
    }
    for (const auto& loc : t.locations) {
      if (loc.status() != LocationStatus::Unvisited) {
        std::cerr << "[test_location] registry location " << loc.name() << " is not unvisited\n";
        ++fails;
      }
    }
    if (t.locations.back().mode() != ModeId::EndGame) {
      std::cerr << "[test_location] last stop of '" << name << "' should end the game\n";
      ++fails;
    }
  }

  {
    Trail t;
    std::string err;
    if (loadTrail("santa-fe", t, &err) || err.find("unknown trail") == std::string::npos) {
      std::cerr << "[test_location] unknown trail should fail with a message, got '" << err << "'\n";
      ++fails;
    }

    Trail broken{};
    broken.name = "broken";
    broken.trailLength = 10;
    broken.locations = {Location("Split", ModeId::ForkInRoad)};
    if (validateTrail(broken, &err)) {
      std::cerr << "[test_location] fork without skip choices should not validate\n";
      ++fails;
    }

    Trail empty{};
    empty.trailLength = 10;
    if (validateTrail(empty)) {
      std::cerr << "[test_location] empty trail should not validate\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_location] pass\n";
  return fails;
}
