#pragma once

#include "frontier/core/Types.h"

#include <cstddef>
#include <string_view>

namespace frontier::sim {

// Game modes a location can ask for on arrival. The dispatcher keeps them on a stack.
enum class ModeId : core::u8 {
  Travel = 0,
  ForkInRoad,
  EndGame,
};

constexpr std::size_t kModeCount = 3;

inline std::string_view modeName(ModeId id) {
  switch (id) {
    case ModeId::Travel:     return "Travel";
    case ModeId::ForkInRoad: return "ForkInRoad";
    case ModeId::EndGame:    return "EndGame";
  }
  return "Unknown";
}

} // namespace frontier::sim
