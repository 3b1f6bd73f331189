#include "frontier/game/ForkForms.h"

#include "frontier/core/Log.h"
#include "frontier/game/Input.h"
#include "frontier/sim/SimulationContext.h"

#include <sstream>

namespace frontier::game {

void LocationFork::onFormPostCreate() {
  m_skipChoices.clear();

  const sim::Location* here = m_ctx.trail.currentLocation();
  if (!here) return;

  int key = 1;
  for (const auto& choice : here->skipChoices()) {
    m_skipChoices.emplace(key++, choice);
  }
}

std::string LocationFork::render() const {
  std::ostringstream out;
  out << "\nThe trail divides here. You may:\n\n";

  for (const auto& [key, loc] : m_skipChoices) {
    out << "  " << key << ". head for " << loc.name() << "\n";
  }

  // The map is always offered one past the last branch.
  const int mapChoice = static_cast<int>(m_skipChoices.size()) + 1;
  out << "  " << mapChoice << ". see the map";
  return out.str();
}

Transition LocationFork::onInput(std::string_view input) {
  const auto choice = parseChoice(input);
  if (!choice || *choice <= 0) return Transition::none();

  const auto it = m_skipChoices.find(*choice);
  if (it == m_skipChoices.end()) {
    return Transition::setForm(FormId::LookAtMap);
  }

  FRONTIER_LOG_DEBUG("Fork: player chose " + it->second.name());
  m_ctx.trail.insertLocation(it->second);
  return Transition::setForm(FormId::LocationDepart);
}

std::string LocationDepart::onDialogPrompt() const {
  const sim::Location* next = m_ctx.trail.nextLocation();

  std::ostringstream out;
  out << "\nYou decide to head for " << (next ? next->name() : std::string("the end of the trail")) << ".\n"
      << "It is " << m_ctx.trail.nextLegDistance() << " miles away.\n\n";
  return out.str();
}

Transition LocationDepart::onDialogResponse(std::string_view input) {
  (void)input;
  if (m_ctx.trail.departCurrentLocation()) {
    m_ctx.vehicle.drive();
  }
  return Transition::removeMode();
}

} // namespace frontier::game
