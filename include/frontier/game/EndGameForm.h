#pragma once

#include "frontier/game/Form.h"

namespace frontier::game {

// Final summary. Input is ignored; the simulation is finished once this shows.
class EndGameForm final : public Form {
public:
  using Form::Form;

  FormId id() const override { return FormId::EndGame; }
  std::string render() const override;
  Transition onInput(std::string_view input) override;
};

} // namespace frontier::game
