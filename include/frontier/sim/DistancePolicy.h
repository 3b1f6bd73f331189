#pragma once

#include "frontier/core/Random.h"
#include "frontier/core/Types.h"

#include <memory>
#include <string_view>

namespace frontier::sim {

// Decides how many miles separate the current location from the next one.
//
// remainingBudget: trail length not yet handed out to earlier legs (>= 0).
// remainingLegs:   legs still to travel including this one (>= 1).
//
// Implementations return a positive distance; the trail module clamps the
// result to the remaining budget.
class DistancePolicy {
public:
  virtual ~DistancePolicy() = default;

  virtual int nextDistance(int remainingBudget, int remainingLegs) = 0;
  virtual std::string_view name() const = 0;
};

// Same distance for every leg.
class FixedDistancePolicy final : public DistancePolicy {
public:
  explicit FixedDistancePolicy(int miles = 1);

  int nextDistance(int remainingBudget, int remainingLegs) override;
  std::string_view name() const override { return "fixed"; }

private:
  int m_miles{1};
};

// Spreads the remaining budget evenly over the remaining legs.
class EvenSplitDistancePolicy final : public DistancePolicy {
public:
  int nextDistance(int remainingBudget, int remainingLegs) override;
  std::string_view name() const override { return "even"; }
};

// Uniform draw within +/-50% of the even split, seeded for reproducible runs.
class RandomDistancePolicy final : public DistancePolicy {
public:
  explicit RandomDistancePolicy(core::u64 seed);

  int nextDistance(int remainingBudget, int remainingLegs) override;
  std::string_view name() const override { return "random"; }

private:
  core::SplitMix64 m_rng;
};

enum class DistancePolicyKind : core::u8 {
  Fixed = 0,
  EvenSplit,
  Random,
};

bool parseDistancePolicyKind(std::string_view text, DistancePolicyKind& out);

std::unique_ptr<DistancePolicy> makeDistancePolicy(DistancePolicyKind kind,
                                                   int fixedMiles,
                                                   core::u64 seed);

} // namespace frontier::sim
