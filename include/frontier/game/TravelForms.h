#pragma once

#include "frontier/game/Form.h"

namespace frontier::game {

// Root form of the Travel mode. While the wagon is parked it offers the travel
// menu; while rolling it only reports progress and lets the simulation tick.
class TravelMenu final : public Form {
public:
  using Form::Form;

  FormId id() const override { return FormId::TravelMenu; }
  std::string render() const override;
  Transition onInput(std::string_view input) override;
  bool awaitsInput() const override;
};

// Tells the player how far the next stop is. Acknowledging it leaves the
// current location and puts the wagon back on the trail.
class ContinueOnTrailState final : public DialogForm {
public:
  using DialogForm::DialogForm;

  FormId id() const override { return FormId::ContinueOnTrail; }

protected:
  std::string onDialogPrompt() const override;
  Transition onDialogResponse(std::string_view input) override;
};

// Read-only listing of the wagon inventory.
class CheckSuppliesState final : public DialogForm {
public:
  using DialogForm::DialogForm;

  FormId id() const override { return FormId::CheckSupplies; }

protected:
  std::string onDialogPrompt() const override;
  Transition onDialogResponse(std::string_view input) override;
};

// Every stop on the route with its visit marker, plus miles traveled.
class LookAtMap final : public DialogForm {
public:
  using DialogForm::DialogForm;

  FormId id() const override { return FormId::LookAtMap; }

protected:
  std::string onDialogPrompt() const override;
  Transition onDialogResponse(std::string_view input) override;
};

// Shows the most recent entry of the event history.
class EventNotice final : public DialogForm {
public:
  using DialogForm::DialogForm;

  FormId id() const override { return FormId::EventNotice; }

protected:
  std::string onDialogPrompt() const override;
  Transition onDialogResponse(std::string_view input) override;
};

} // namespace frontier::game
