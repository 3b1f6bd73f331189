#pragma once

#include "frontier/core/Types.h"

#include <string>
#include <string_view>

namespace frontier::sim {
struct SimulationContext;
}

namespace frontier::game {

enum class FormId : core::u8 {
  TravelMenu = 0,
  ContinueOnTrail,
  CheckSupplies,
  LookAtMap,
  LocationFork,
  LocationDepart,
  EventNotice,
  EndGame,
};

std::string_view formName(FormId id);

enum class TransitionKind : core::u8 {
  None = 0,
  CloseForm,  // go back to the mode's root form
  SetForm,    // replace the current form with `form`
  RemoveMode, // pop the current mode
};

// Returned by input handlers; the dispatcher applies it to the mode stack.
struct Transition {
  TransitionKind kind{TransitionKind::None};
  FormId form{FormId::TravelMenu};

  static Transition none() { return {}; }
  static Transition closeForm() { return {TransitionKind::CloseForm, FormId::TravelMenu}; }
  static Transition setForm(FormId id) { return {TransitionKind::SetForm, id}; }
  static Transition removeMode() { return {TransitionKind::RemoveMode, FormId::TravelMenu}; }
};

// One screen of the text interface, attached to a mode.
//
// render() must be a pure function of the context: calling it again without
// new input returns the same text. State changes happen in onInput().
class Form {
public:
  explicit Form(sim::SimulationContext& ctx) : m_ctx(ctx) {}
  virtual ~Form() = default;

  Form(const Form&) = delete;
  Form& operator=(const Form&) = delete;

  virtual FormId id() const = 0;

  // Called once after the form is attached, before the first render.
  virtual void onFormPostCreate() {}

  virtual std::string render() const = 0;
  virtual Transition onInput(std::string_view input) = 0;

  // False while the form only reports progress and the simulation should keep ticking.
  virtual bool awaitsInput() const { return true; }

protected:
  sim::SimulationContext& m_ctx;
};

// Prompt-style form: shows a block of text and reacts to any line of input.
class DialogForm : public Form {
public:
  using Form::Form;

  std::string render() const final;
  Transition onInput(std::string_view input) final;

protected:
  virtual std::string onDialogPrompt() const = 0;
  virtual Transition onDialogResponse(std::string_view input) = 0;
};

} // namespace frontier::game
