#pragma once

#include "frontier/core/Types.h"

#include <array>
#include <string_view>

namespace frontier::sim {

// Table order is the display order of the wagon inventory.
enum class ItemId : core::u8 {
  Oxen = 0,
  Clothing,
  Ammunition,
  Wheel,
  Axle,
  Tongue,
  Food,
  Cash,

  Count
};

constexpr std::size_t kItemCount = static_cast<std::size_t>(ItemId::Count);

struct ItemDef {
  ItemId id{};
  const char* name{};   // display name
  double basePrice{};   // dollars per unit at the outfitter
};

const std::array<ItemDef, kItemCount>& itemTable();
const ItemDef& itemDef(ItemId id);
std::string_view itemName(ItemId id);

} // namespace frontier::sim
