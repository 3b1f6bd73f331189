#include "frontier/game/Simulation.h"

#include "frontier/core/Log.h"
#include "frontier/core/Random.h"
#include "frontier/game/FormFactory.h"
#include "frontier/sim/TrailRegistry.h"

#include <algorithm>
#include <utility>

namespace frontier::game {

StartingInventory defaultStartingInventory() {
  return {
    {sim::ItemId::Oxen,        6.0},
    {sim::ItemId::Clothing,    4.0},
    {sim::ItemId::Ammunition, 200.0},
    {sim::ItemId::Wheel,       1.0},
    {sim::ItemId::Axle,        1.0},
    {sim::ItemId::Tongue,      1.0},
    {sim::ItemId::Food,      500.0},
    {sim::ItemId::Cash,      400.0},
  };
}

bool validateConfig(const SimulationConfig& cfg, std::string* outError) {
  auto fail = [outError](std::string msg) {
    if (outError) *outError = std::move(msg);
    return false;
  };

  const auto names = sim::trailNames();
  if (std::find(names.begin(), names.end(), cfg.trailName) == names.end()) {
    return fail("unknown trail '" + cfg.trailName + "'");
  }
  if (cfg.mileage < 1) return fail("mileage must be at least 1 mile per turn");
  if (cfg.legMiles < 1) return fail("leg distance must be at least 1 mile");
  if (cfg.eventChanceScale < 0.0) return fail("event chance scale must not be negative");
  if (!sim::isValidDate(cfg.startDate)) return fail("start date is not a calendar date");

  for (const auto& [id, qty] : cfg.startingInventory) {
    if (id >= sim::ItemId::Count) return fail("starting inventory has an unknown item");
    if (qty < 0.0) return fail("starting inventory has a negative quantity of " + std::string(sim::itemName(id)));
  }
  return true;
}

bool Simulation::init(const SimulationConfig& cfg, std::string* outError) {
  shutdown();

  if (!validateConfig(cfg, outError)) {
    FRONTIER_LOG_ERROR("Simulation: invalid config" + (outError ? ": " + *outError : std::string()));
    return false;
  }

  sim::Trail trail;
  if (!sim::loadTrail(cfg.trailName, trail, outError)) {
    FRONTIER_LOG_ERROR("Simulation: failed to load trail '" + cfg.trailName + "'");
    return false;
  }

  auto ctx = std::make_unique<sim::SimulationContext>();
  ctx->trail.load(std::move(trail),
                  sim::makeDistancePolicy(cfg.distancePolicy, cfg.legMiles,
                                          core::deriveSeed(cfg.seed, "distance")));
  ctx->vehicle.setMileage(cfg.mileage);
  for (const auto& [id, qty] : cfg.startingInventory) {
    ctx->vehicle.addItem(id, qty);
  }
  ctx->date = cfg.startDate;
  ctx->events = sim::RandomEventDirector(sim::defaultRandomEvents(),
                                         core::deriveSeed(cfg.seed, "events"),
                                         cfg.eventChanceScale);
  m_ctx = std::move(ctx);

  FRONTIER_LOG_INFO("Simulation: starting '" + cfg.trailName + "' seed=" + std::to_string(cfg.seed)
                    + " distance=" + std::string(m_ctx->trail.distancePolicy()->name()));

  pushMode(sim::ModeId::Travel);

  // Opening turn: arrive at the first location.
  tick();
  return true;
}

void Simulation::shutdown() {
  // Forms hold references into the context; drop them first.
  m_modes.clear();
  core::clearLogTurn();
  if (m_ctx) {
    m_ctx->trail.destroy();
    m_ctx.reset();
  }
}

bool Simulation::finished() const {
  const ModeStack::Entry* top = m_modes.top();
  return m_ctx && top && top->mode == sim::ModeId::EndGame;
}

bool Simulation::awaitingInput() const {
  const Form* form = activeForm();
  return form && form->awaitsInput();
}

const Form* Simulation::activeForm() const {
  const ModeStack::Entry* top = m_modes.top();
  return top ? top->form.get() : nullptr;
}

bool Simulation::tick(bool systemTick) {
  if (!m_ctx || systemTick || finished()) return false;

  const ModeStack::Entry* top = m_modes.top();
  if (!top || top->mode != sim::ModeId::Travel || !top->form || top->form->id() != FormId::TravelMenu) {
    return false;
  }
  if (m_ctx->vehicle.parked()) return false;

  // Turn N happens on start date + N days.
  if (m_ctx->totalTurns > 0) sim::advanceDay(m_ctx->date);
  core::setLogTurn(m_ctx->totalTurns);

  const sim::TrailTickResult result = m_ctx->trail.onTick(systemTick, m_ctx->vehicle, m_ctx->totalTurns);
  ++m_ctx->totalTurns;

  // Nothing else happens on a turn that ends at a location.
  const sim::RandomEvent* fired = nullptr;
  if (!result.arrived && !result.endOfGame) {
    fired = m_ctx->events.roll(*m_ctx);
  }

  applyTickResult(result);

  if (fired && !finished()) attachForm(FormId::EventNotice);
  return true;
}

void Simulation::handleInput(std::string_view input) {
  if (!m_ctx) return;

  ModeStack::Entry* top = m_modes.top();
  if (!top || !top->form) return;

  const Transition t = top->form->onInput(input);
  applyTransition(t);
}

std::string Simulation::render() const {
  const Form* form = activeForm();
  return form ? form->render() : std::string();
}

void Simulation::applyTickResult(const sim::TrailTickResult& result) {
  if (result.endOfGame) {
    m_ctx->history.add(sim::EventHistoryItem{sim::EventCategory::Trail, "End of the trail",
                                             "Rolled past the last stop of the " + m_ctx->trail.trailName() + " trail.",
                                             m_ctx->date});
    pushMode(sim::ModeId::EndGame);
    return;
  }

  if (!result.arrived) return;

  m_ctx->history.add(sim::EventHistoryItem{sim::EventCategory::Trail, "Arrived at " + result.locationName,
                                           std::string(), m_ctx->date});
  pushMode(result.requestedMode.value_or(sim::ModeId::Travel));
}

void Simulation::applyTransition(const Transition& transition) {
  switch (transition.kind) {
    case TransitionKind::None:
      return;

    case TransitionKind::CloseForm:
      if (const ModeStack::Entry* top = m_modes.top()) attachForm(rootForm(top->mode));
      return;

    case TransitionKind::SetForm:
      attachForm(transition.form);
      return;

    case TransitionKind::RemoveMode:
      m_modes.pop();
      if (m_modes.empty()) pushMode(sim::ModeId::Travel);
      FRONTIER_LOG_DEBUG("Simulation: mode removed, "
                         + std::string(sim::modeName(m_modes.top()->mode)) + " on top");
      return;
  }
}

void Simulation::pushMode(sim::ModeId mode) {
  m_modes.push(mode, makeForm(rootForm(mode), *m_ctx));
  FRONTIER_LOG_DEBUG("Simulation: mode " + std::string(sim::modeName(mode)) + " (run "
                     + std::to_string(m_modes.runCount(mode)) + ")");
}

void Simulation::attachForm(FormId id) {
  m_modes.setForm(makeForm(id, *m_ctx));
  FRONTIER_LOG_DEBUG("Simulation: form " + std::string(formName(id)));
}

} // namespace frontier::game
