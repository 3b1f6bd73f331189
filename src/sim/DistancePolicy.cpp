#include "frontier/sim/DistancePolicy.h"

#include <algorithm>

namespace frontier::sim {

FixedDistancePolicy::FixedDistancePolicy(int miles) : m_miles(std::max(1, miles)) {}

int FixedDistancePolicy::nextDistance(int remainingBudget, int remainingLegs) {
  (void)remainingBudget;
  (void)remainingLegs;
  return m_miles;
}

int EvenSplitDistancePolicy::nextDistance(int remainingBudget, int remainingLegs) {
  return std::max(1, remainingBudget / std::max(1, remainingLegs));
}

RandomDistancePolicy::RandomDistancePolicy(core::u64 seed) : m_rng(seed) {}

int RandomDistancePolicy::nextDistance(int remainingBudget, int remainingLegs) {
  const int even = std::max(1, remainingBudget / std::max(1, remainingLegs));
  const int lo = std::max(1, even / 2);
  const int hi = std::max(lo, even + even / 2);
  return m_rng.between(lo, hi);
}

bool parseDistancePolicyKind(std::string_view text, DistancePolicyKind& out) {
  if (text == "fixed") {
    out = DistancePolicyKind::Fixed;
  } else if (text == "even") {
    out = DistancePolicyKind::EvenSplit;
  } else if (text == "random") {
    out = DistancePolicyKind::Random;
  } else {
    return false;
  }
  return true;
}

std::unique_ptr<DistancePolicy> makeDistancePolicy(DistancePolicyKind kind,
                                                   int fixedMiles,
                                                   core::u64 seed) {
  switch (kind) {
    case DistancePolicyKind::EvenSplit: return std::make_unique<EvenSplitDistancePolicy>();
    case DistancePolicyKind::Random:    return std::make_unique<RandomDistancePolicy>(seed);
    case DistancePolicyKind::Fixed:     break;
  }
  return std::make_unique<FixedDistancePolicy>(fixedMiles);
}

} // namespace frontier::sim
