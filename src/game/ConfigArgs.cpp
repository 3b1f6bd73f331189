#include "frontier/game/ConfigArgs.h"

#include "frontier/core/Random.h"

#include <utility>

namespace frontier::game {

bool applyArgs(const core::Args& args, SimulationConfig& cfg, std::string* outError) {
  auto fail = [outError](std::string msg) {
    if (outError) *outError = std::move(msg);
    return false;
  };

  (void)args.getString("trail", cfg.trailName);

  if (const auto seedText = args.last("seed")) {
    unsigned long long s = 0;
    cfg.seed = args.getU64("seed", s) ? static_cast<core::u64>(s) : core::seedFromString(*seedText);
  }

  std::string policy;
  if (args.getString("distance", policy) && !sim::parseDistancePolicyKind(policy, cfg.distancePolicy)) {
    return fail("unknown distance policy '" + policy + "' (fixed, even, random)");
  }

  if (args.has("leg") && !args.getInt("leg", cfg.legMiles)) {
    return fail("--leg expects a whole number of miles");
  }
  if (args.has("mileage") && !args.getInt("mileage", cfg.mileage)) {
    return fail("--mileage expects a whole number of miles");
  }
  if (args.has("events") && !args.getDouble("events", cfg.eventChanceScale)) {
    return fail("--events expects a number");
  }

  return validateConfig(cfg, outError);
}

} // namespace frontier::game
