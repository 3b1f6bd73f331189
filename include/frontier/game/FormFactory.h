#pragma once

#include "frontier/game/Form.h"
#include "frontier/sim/Mode.h"

#include <memory>

namespace frontier::game {

// The form a mode falls back to when its current form closes.
FormId rootForm(sim::ModeId mode);

// Creates the form and runs its post-create hook.
std::unique_ptr<Form> makeForm(FormId id, sim::SimulationContext& ctx);

} // namespace frontier::game
