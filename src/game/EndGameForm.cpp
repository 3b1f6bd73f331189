#include "frontier/game/EndGameForm.h"

#include "frontier/game/TextFormat.h"
#include "frontier/sim/SimulationContext.h"

#include <sstream>

namespace frontier::game {

std::string EndGameForm::render() const {
  const auto& trail = m_ctx.trail;

  // Either parked at a final stop or rolled past the last location.
  const sim::Location* here = trail.currentLocation();
  const std::string where = here ? here->name()
                          : (trail.locations().empty() ? std::string("the trail")
                                                       : trail.locations().back().name());

  std::ostringstream out;
  out << "\nCongratulations! You have made it to " << where << ".\n\n"
      << "Arrived on " << sim::formatDate(m_ctx.date) << " after "
      << m_ctx.totalTurns << " days on the trail.\n"
      << "Miles traveled: " << m_ctx.vehicle.odometer() << " miles\n"
      << "Events on the road: "
      << (m_ctx.history.size() - m_ctx.history.countOf(sim::EventCategory::Trail)) << "\n"
      << "Supplies remaining are worth " << formatCurrency(m_ctx.vehicle.inventoryValue()) << "\n";
  return out.str();
}

Transition EndGameForm::onInput(std::string_view input) {
  (void)input;
  return Transition::none();
}

} // namespace frontier::game
