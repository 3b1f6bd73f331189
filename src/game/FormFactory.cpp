#include "frontier/game/FormFactory.h"

#include "frontier/game/EndGameForm.h"
#include "frontier/game/ForkForms.h"
#include "frontier/game/TravelForms.h"

namespace frontier::game {

FormId rootForm(sim::ModeId mode) {
  switch (mode) {
    case sim::ModeId::Travel:     return FormId::TravelMenu;
    case sim::ModeId::ForkInRoad: return FormId::LocationFork;
    case sim::ModeId::EndGame:    return FormId::EndGame;
  }
  return FormId::TravelMenu;
}

std::unique_ptr<Form> makeForm(FormId id, sim::SimulationContext& ctx) {
  std::unique_ptr<Form> form;
  switch (id) {
    case FormId::TravelMenu:      form = std::make_unique<TravelMenu>(ctx); break;
    case FormId::ContinueOnTrail: form = std::make_unique<ContinueOnTrailState>(ctx); break;
    case FormId::CheckSupplies:   form = std::make_unique<CheckSuppliesState>(ctx); break;
    case FormId::LookAtMap:       form = std::make_unique<LookAtMap>(ctx); break;
    case FormId::LocationFork:    form = std::make_unique<LocationFork>(ctx); break;
    case FormId::LocationDepart:  form = std::make_unique<LocationDepart>(ctx); break;
    case FormId::EventNotice:     form = std::make_unique<EventNotice>(ctx); break;
    case FormId::EndGame:         form = std::make_unique<EndGameForm>(ctx); break;
  }
  if (form) form->onFormPostCreate();
  return form;
}

} // namespace frontier::game
