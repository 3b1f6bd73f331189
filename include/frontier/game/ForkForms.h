#pragma once

#include "frontier/game/Form.h"
#include "frontier/sim/Location.h"

#include <map>

namespace frontier::game {

// The trail divides at the current location. The player picks one of its skip
// choices (numbered from 1) or asks for the map; the pick is spliced into the
// route right after the current location.
class LocationFork final : public Form {
public:
  using Form::Form;

  FormId id() const override { return FormId::LocationFork; }
  void onFormPostCreate() override;
  std::string render() const override;
  Transition onInput(std::string_view input) override;

  const std::map<int, sim::Location>& skipChoices() const { return m_skipChoices; }

private:
  std::map<int, sim::Location> m_skipChoices;
};

// Confirms the chosen branch; acknowledging it leaves the fork.
class LocationDepart final : public DialogForm {
public:
  using DialogForm::DialogForm;

  FormId id() const override { return FormId::LocationDepart; }

protected:
  std::string onDialogPrompt() const override;
  Transition onDialogResponse(std::string_view input) override;
};

} // namespace frontier::game
