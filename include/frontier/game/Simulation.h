#pragma once

#include "frontier/core/Types.h"
#include "frontier/game/ModeStack.h"
#include "frontier/sim/DistancePolicy.h"
#include "frontier/sim/GameDate.h"
#include "frontier/sim/Item.h"
#include "frontier/sim/SimulationContext.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace frontier::game {

using StartingInventory = std::vector<std::pair<sim::ItemId, double>>;

// Outfit of a family leaving Independence.
StartingInventory defaultStartingInventory();

struct SimulationConfig {
  core::u64 seed{1848};
  std::string trailName{"oregon"};

  sim::DistancePolicyKind distancePolicy{sim::DistancePolicyKind::Fixed};
  int legMiles{1}; // used by the fixed policy

  int mileage{20};              // miles per travel turn
  double eventChanceScale{1.0}; // 0 disables random events

  sim::GameDate startDate{1848, 3, 1};
  StartingInventory startingInventory{defaultStartingInventory()};
};

// Checks ranges and the trail name without building anything.
bool validateConfig(const SimulationConfig& cfg, std::string* outError = nullptr);

// Owns the simulation context and the mode stack, ticks the world and routes
// player input to the active form.
//
// Travel turns only happen while the Travel menu is showing and the wagon is
// rolling; every other screen waits for input.
class Simulation {
public:
  Simulation() = default;
  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  // Loads the trail and outfits the wagon, then runs the opening turn that
  // arrives at the first location.
  bool init(const SimulationConfig& cfg, std::string* outError = nullptr);
  void shutdown();

  bool running() const { return static_cast<bool>(m_ctx); }
  bool finished() const;
  bool awaitingInput() const;

  // One simulated turn. System ticks (frame pulses) never move the wagon.
  // Returns true if the world advanced.
  bool tick(bool systemTick = false);

  void handleInput(std::string_view input);

  // Text of the active form; empty when not running.
  std::string render() const;

  // Current form id, if any.
  const Form* activeForm() const;

  const sim::SimulationContext& context() const { return *m_ctx; }
  sim::SimulationContext& context() { return *m_ctx; }
  const ModeStack& modes() const { return m_modes; }

private:
  void applyTickResult(const sim::TrailTickResult& result);
  void applyTransition(const Transition& transition);
  void pushMode(sim::ModeId mode);
  void attachForm(FormId id);

  std::unique_ptr<sim::SimulationContext> m_ctx;
  ModeStack m_modes;
};

} // namespace frontier::game
