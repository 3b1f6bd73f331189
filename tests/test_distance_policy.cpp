#include "frontier/sim/DistancePolicy.h"

#include <iostream>

int test_distance_policy() {
  int fails = 0;

  using namespace frontier::sim;

  {
    FixedDistancePolicy fixed;
    if (fixed.nextDistance(2000, 10) != 1 || fixed.nextDistance(0, 1) != 1) {
      std::cerr << "[test_distance_policy] default fixed leg should be 1 mile\n";
      ++fails;
    }
    FixedDistancePolicy zero(0);
    if (zero.nextDistance(100, 3) != 1) {
      std::cerr << "[test_distance_policy] fixed leg must stay positive\n";
      ++fails;
    }
  }

  {
    EvenSplitDistancePolicy even;
    if (even.nextDistance(100, 4) != 25) {
      std::cerr << "[test_distance_policy] even split 100/4 expected 25\n";
      ++fails;
    }
    if (even.nextDistance(3, 10) != 1 || even.nextDistance(50, 0) != 50) {
      std::cerr << "[test_distance_policy] even split edge cases\n";
      ++fails;
    }
  }

  // Same seed, same legs; every leg within +/-50% of the even split.
  {
    RandomDistancePolicy a(42);
    RandomDistancePolicy b(42);
    for (int i = 0; i < 64; ++i) {
      const int da = a.nextDistance(1000, 10);
      const int db = b.nextDistance(1000, 10);
      if (da != db) {
        std::cerr << "[test_distance_policy] random policy not deterministic at draw " << i << "\n";
        ++fails;
        break;
      }
      if (da < 50 || da > 150) {
        std::cerr << "[test_distance_policy] random leg out of range: " << da << "\n";
        ++fails;
        break;
      }
    }
  }

  {
    DistancePolicyKind kind = DistancePolicyKind::Fixed;
    if (!parseDistancePolicyKind("random", kind) || kind != DistancePolicyKind::Random) {
      std::cerr << "[test_distance_policy] failed to parse 'random'\n";
      ++fails;
    }
    if (parseDistancePolicyKind("gaussian", kind) || kind != DistancePolicyKind::Random) {
      std::cerr << "[test_distance_policy] unknown policy should be rejected untouched\n";
      ++fails;
    }

    const auto p = makeDistancePolicy(DistancePolicyKind::EvenSplit, 1, 7);
    if (!p || p->name() != "even") {
      std::cerr << "[test_distance_policy] factory returned wrong policy\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_distance_policy] pass\n";
  return fails;
}
