#include "frontier/game/TravelForms.h"

#include "frontier/game/Input.h"
#include "frontier/game/TextFormat.h"
#include "frontier/sim/SimulationContext.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace frontier::game {
namespace {
  std::string nextStopName(const sim::TrailModule& trail) {
    const sim::Location* next = trail.nextLocation();
    return next ? next->name() : std::string("end of the trail");
  }
} // namespace

// ---- TravelMenu ----

std::string TravelMenu::render() const {
  const auto& trail = m_ctx.trail;
  const auto& vehicle = m_ctx.vehicle;

  std::ostringstream out;
  out << "\n" << sim::formatDate(m_ctx.date) << "\n";

  if (!vehicle.parked()) {
    out << "Traveling to the " << nextStopName(trail) << ": "
        << trail.distanceToNextLocation() << " miles to go.\n"
        << "Miles traveled: " << vehicle.odometer() << " miles\n";
    return out.str();
  }

  out << "Food: " << formatCount(vehicle.quantity(sim::ItemId::Food)) << " pounds\n"
      << "Next landmark: " << trail.nextLegDistance() << " miles\n"
      << "Miles traveled: " << vehicle.odometer() << " miles\n\n";

  if (const sim::Location* here = trail.currentLocation()) {
    out << "You are at " << here->name() << ".\n";
  }

  out << "You may:\n\n"
      << "  1. Continue on trail\n"
      << "  2. Check supplies\n"
      << "  3. Look at map\n\n"
      << "What is your choice?\n";
  return out.str();
}

Transition TravelMenu::onInput(std::string_view input) {
  if (!m_ctx.vehicle.parked()) return Transition::none();

  const auto choice = parseChoice(input);
  if (!choice) return Transition::none();

  switch (*choice) {
    case 1: return Transition::setForm(FormId::ContinueOnTrail);
    case 2: return Transition::setForm(FormId::CheckSupplies);
    case 3: return Transition::setForm(FormId::LookAtMap);
    default: return Transition::none();
  }
}

bool TravelMenu::awaitsInput() const {
  return m_ctx.vehicle.parked();
}

// ---- ContinueOnTrailState ----

std::string ContinueOnTrailState::onDialogPrompt() const {
  const auto& trail = m_ctx.trail;
  const sim::Location* here = trail.currentLocation();

  std::ostringstream out;
  out << "\nFrom " << (here ? here->name() : std::string("the trail"))
      << " it is " << trail.nextLegDistance() << "\n"
      << "miles to the " << nextStopName(trail) << "\n\n";
  return out.str();
}

Transition ContinueOnTrailState::onDialogResponse(std::string_view input) {
  (void)input;
  if (m_ctx.trail.departCurrentLocation()) {
    m_ctx.vehicle.drive();
  }
  return Transition::closeForm();
}

// ---- CheckSuppliesState ----

std::string CheckSuppliesState::onDialogPrompt() const {
  std::ostringstream out;
  out << "\nYour Supplies\n\n";

  for (const auto& [id, item] : m_ctx.vehicle.inventory()) {
    std::string name = item.name;
    for (char& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    const std::string quantity = (id == sim::ItemId::Cash) ? formatCurrency(item.quantity)
                                                           : formatCount(item.quantity);

    out << std::left << std::setw(15) << name << " "
        << std::right << std::setw(3) << quantity << "\n";
  }
  return out.str();
}

Transition CheckSuppliesState::onDialogResponse(std::string_view input) {
  (void)input;
  return Transition::closeForm();
}

// ---- LookAtMap ----

std::string LookAtMap::onDialogPrompt() const {
  const auto& trail = m_ctx.trail;

  std::ostringstream out;
  out << "\nMap of the " << trail.trailName() << " trail\n\n";

  const auto& locs = trail.locations();
  for (std::size_t i = 0; i < locs.size(); ++i) {
    const char* marker = "[ ]";
    if (i == trail.locationIndex()) {
      marker = "[>]";
    } else if (locs[i].status() != sim::LocationStatus::Unvisited) {
      marker = "[x]";
    }
    out << "  " << marker << " " << locs[i].name() << "\n";
  }

  out << "\nMiles traveled: " << m_ctx.vehicle.odometer()
      << " of " << trail.trailLength() << " miles\n\n";
  return out.str();
}

Transition LookAtMap::onDialogResponse(std::string_view input) {
  (void)input;
  return Transition::closeForm();
}

// ---- EventNotice ----

std::string EventNotice::onDialogPrompt() const {
  const sim::EventHistoryItem* item = m_ctx.history.latest();
  if (!item) return "\n";

  std::ostringstream out;
  out << "\n" << sim::formatDate(item->timestamp) << "\n\n"
      << item->name << "\n"
      << item->detail << "\n\n";
  return out.str();
}

Transition EventNotice::onDialogResponse(std::string_view input) {
  (void)input;
  return Transition::closeForm();
}

} // namespace frontier::game
