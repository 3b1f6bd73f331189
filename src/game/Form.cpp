#include "frontier/game/Form.h"

namespace frontier::game {

std::string_view formName(FormId id) {
  switch (id) {
    case FormId::TravelMenu:      return "TravelMenu";
    case FormId::ContinueOnTrail: return "ContinueOnTrail";
    case FormId::CheckSupplies:   return "CheckSupplies";
    case FormId::LookAtMap:       return "LookAtMap";
    case FormId::LocationFork:    return "LocationFork";
    case FormId::LocationDepart:  return "LocationDepart";
    case FormId::EventNotice:     return "EventNotice";
    case FormId::EndGame:         return "EndGame";
  }
  return "Unknown";
}

std::string DialogForm::render() const {
  return onDialogPrompt() + "Press ENTER KEY to continue\n";
}

Transition DialogForm::onInput(std::string_view input) {
  return onDialogResponse(input);
}

} // namespace frontier::game
