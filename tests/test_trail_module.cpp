#include "frontier/sim/TrailModule.h"

#include <iostream>
#include <memory>
#include <string>

using namespace frontier::sim;

namespace {
Trail threeStops(int length = 100) {
  Trail t{};
  t.name = "test";
  t.trailLength = length;
  t.locations = {Location("Alpha"), Location("Bravo"), Location("Charlie")};
  return t;
}
} // namespace

int test_trail_module() {
  int fails = 0;

  // First tick: arrive at the start without advancing.
  {
    TrailModule trail(threeStops(), std::make_unique<FixedDistancePolicy>(5));
    Vehicle v;
    v.setMileage(5);

    const auto r = trail.onTick(false, v, 0);
    if (!r.arrived || r.endOfGame || trail.locationIndex() != 0) {
      std::cerr << "[test_trail_module] first tick should arrive at index 0\n";
      ++fails;
    }
    if (!r.requestedMode || *r.requestedMode != ModeId::Travel || r.locationName != "Alpha") {
      std::cerr << "[test_trail_module] first arrival should request Travel at Alpha\n";
      ++fails;
    }
    if (trail.locations()[0].status() != LocationStatus::Arrived || !v.parked()) {
      std::cerr << "[test_trail_module] start location not flagged / vehicle not parked\n";
      ++fails;
    }
    if (trail.distanceToNextLocation() != 0 || trail.nextLegDistance() != 5) {
      std::cerr << "[test_trail_module] expected distance 0 and next leg 5, got "
                << trail.distanceToNextLocation() << "/" << trail.nextLegDistance() << "\n";
      ++fails;
    }
    if (!trail.isFirstLocation(v, 0) || !trail.reachedNextPoint(v)) {
      std::cerr << "[test_trail_module] first location helpers disagree\n";
      ++fails;
    }

    // A second opening tick does not arrive again.
    const auto again = trail.arriveAtNextLocation(v, 0);
    if (again.arrived || trail.locationIndex() != 0 || trail.distanceGenerated() != 5) {
      std::cerr << "[test_trail_module] repeated opening arrival should be ignored\n";
      ++fails;
    }

    // distance 5, mileage 5, one turn elapsed -> arrive at index 1.
    if (!trail.departCurrentLocation()) {
      std::cerr << "[test_trail_module] depart from Alpha failed\n";
      ++fails;
    }
    v.drive();
    if (trail.distanceToNextLocation() != 5 || trail.locations()[0].status() != LocationStatus::Departed) {
      std::cerr << "[test_trail_module] departure should start the 5 mile leg\n";
      ++fails;
    }

    const auto r2 = trail.onTick(false, v, 1);
    if (!r2.arrived || trail.locationIndex() != 1 || trail.distanceToNextLocation() != 0) {
      std::cerr << "[test_trail_module] expected arrival at index 1 with distance 0, got index "
                << trail.locationIndex() << " distance " << trail.distanceToNextLocation() << "\n";
      ++fails;
    }
    if (r2.distanceCovered != 5 || v.odometer() != 5) {
      std::cerr << "[test_trail_module] odometer should read 5, got " << v.odometer() << "\n";
      ++fails;
    }
    if (trail.currentLocation() == nullptr || trail.currentLocation()->name() != "Bravo"
        || !trail.currentLocation()->arrived() || !v.parked()) {
      std::cerr << "[test_trail_module] Bravo should be arrived with vehicle parked\n";
      ++fails;
    }
    if (trail.nextLocation() == nullptr || trail.nextLocation()->name() != "Charlie") {
      std::cerr << "[test_trail_module] next location after Bravo should be Charlie\n";
      ++fails;
    }
  }

  // Partial ticks subtract exactly the mileage and never arrive.
  {
    TrailModule trail(threeStops(), std::make_unique<FixedDistancePolicy>(5));
    Vehicle v;
    v.setMileage(2);
    trail.onTick(false, v, 0);
    trail.departCurrentLocation();
    v.drive();

    const auto r1 = trail.onTick(false, v, 1);
    const auto r2 = trail.onTick(false, v, 2);
    if (r1.arrived || r2.arrived || trail.distanceToNextLocation() != 1 || trail.locationIndex() != 0) {
      std::cerr << "[test_trail_module] partial ticks: expected 1 mile left at index 0, got "
                << trail.distanceToNextLocation() << " at " << trail.locationIndex() << "\n";
      ++fails;
    }

    // 1 - 2 < 0: clamp to 0 and arrive once.
    const auto r3 = trail.onTick(false, v, 3);
    if (!r3.arrived || trail.distanceToNextLocation() != 0 || trail.locationIndex() != 1) {
      std::cerr << "[test_trail_module] overshoot should clamp and arrive\n";
      ++fails;
    }
    if (r3.distanceCovered != 1 || v.odometer() != 5) {
      std::cerr << "[test_trail_module] overshoot should only count the miles left, odometer="
                << v.odometer() << "\n";
      ++fails;
    }
  }

  // Last location: next is none; rolling past it ends the game once.
  {
    TrailModule trail(threeStops(), std::make_unique<FixedDistancePolicy>(1));
    Vehicle v;
    v.setMileage(10);

    for (frontier::core::u32 turn = 0; turn < 3; ++turn) {
      if (turn > 0) {
        trail.departCurrentLocation();
        v.drive();
      }
      trail.onTick(false, v, turn);
    }
    if (trail.locationIndex() != 2 || trail.nextLocation() != nullptr) {
      std::cerr << "[test_trail_module] at the last stop nextLocation should be none\n";
      ++fails;
    }

    trail.departCurrentLocation();
    v.drive();
    const auto end = trail.onTick(false, v, 3);
    if (!end.endOfGame || !end.requestedMode || *end.requestedMode != ModeId::EndGame) {
      std::cerr << "[test_trail_module] rolling past the last stop should request EndGame\n";
      ++fails;
    }
    if (!trail.finished() || trail.locationIndex() != trail.locations().size()
        || trail.currentLocation() != nullptr || trail.nextLocation() != nullptr) {
      std::cerr << "[test_trail_module] finished trail should have no current/next location\n";
      ++fails;
    }

    const int generated = trail.distanceGenerated();
    const auto noop = trail.arriveAtNextLocation(v, 4);
    const auto noopTick = trail.onTick(false, v, 5);
    if (noop.arrived || noop.endOfGame || noop.requestedMode || noopTick.endOfGame
        || trail.locationIndex() != trail.locations().size() || trail.distanceGenerated() != generated) {
      std::cerr << "[test_trail_module] arrival after the end should be a no-op\n";
      ++fails;
    }
    if (trail.insertLocation(Location("Delta")) || trail.departCurrentLocation()) {
      std::cerr << "[test_trail_module] finished trail should refuse inserts and departures\n";
      ++fails;
    }
  }

  // Insert splices right after the current location.
  {
    TrailModule trail(threeStops(), std::make_unique<FixedDistancePolicy>(3));
    Vehicle v;
    v.setMileage(3);
    trail.onTick(false, v, 0);

    if (!trail.insertLocation(Location("Detour"))) {
      std::cerr << "[test_trail_module] insert failed\n";
      ++fails;
    }
    const auto& locs = trail.locations();
    if (locs.size() != 4 || locs[0].name() != "Alpha" || locs[1].name() != "Detour" || locs[2].name() != "Bravo") {
      std::cerr << "[test_trail_module] insert landed in the wrong place\n";
      ++fails;
    }
    if (!locs[0].arrived() || trail.nextLocation() == nullptr || trail.nextLocation()->name() != "Detour") {
      std::cerr << "[test_trail_module] insert should not disturb the current location\n";
      ++fails;
    }

    trail.departCurrentLocation();
    v.drive();
    const auto r = trail.onTick(false, v, 1);
    if (!r.arrived || r.locationName != "Detour") {
      std::cerr << "[test_trail_module] expected to arrive at the detour\n";
      ++fails;
    }
  }

  // Generated distance never exceeds the trail length.
  {
    TrailModule trail(threeStops(7), std::make_unique<FixedDistancePolicy>(5));
    Vehicle v;
    v.setMileage(100);
    trail.onTick(false, v, 0);
    const int leg1 = trail.nextLegDistance();
    trail.departCurrentLocation();
    v.drive();
    trail.onTick(false, v, 1);
    const int leg2 = trail.nextLegDistance();
    trail.departCurrentLocation();
    v.drive();
    trail.onTick(false, v, 2);
    const int leg3 = trail.nextLegDistance();

    if (leg1 != 5 || leg2 != 2 || leg3 != 0 || trail.distanceGenerated() > trail.trailLength()) {
      std::cerr << "[test_trail_module] budget clamp: legs " << leg1 << "," << leg2 << "," << leg3 << "\n";
      ++fails;
    }
  }

  // A null policy falls back to the one-mile placeholder; destroy clears everything.
  {
    TrailModule trail(threeStops(), nullptr);
    Vehicle v;
    v.setMileage(1);
    trail.onTick(false, v, 0);
    if (trail.nextLegDistance() != 1 || trail.distancePolicy() == nullptr) {
      std::cerr << "[test_trail_module] default policy should produce 1 mile legs\n";
      ++fails;
    }

    trail.destroy();
    if (trail.loaded() || trail.locationIndex() != 0 || trail.distanceToNextLocation() != 0
        || trail.currentLocation() != nullptr) {
      std::cerr << "[test_trail_module] destroy should reset the module\n";
      ++fails;
    }
    const auto r = trail.onTick(false, v, 1);
    if (r.arrived || r.endOfGame) {
      std::cerr << "[test_trail_module] ticking an unloaded module should do nothing\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_trail_module] pass\n";
  return fails;
}
