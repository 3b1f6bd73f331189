#include "frontier/sim/Item.h"

namespace frontier::sim {

static const std::array<ItemDef, kItemCount> kTable = {{
  {ItemId::Oxen,       "Oxen",        20.00},
  {ItemId::Clothing,   "Clothing",    10.00},
  {ItemId::Ammunition, "Ammunition",   0.10},
  {ItemId::Wheel,      "Wheel",       10.00},
  {ItemId::Axle,       "Axle",        10.00},
  {ItemId::Tongue,     "Tongue",      10.00},
  {ItemId::Food,       "Food",         0.20},
  {ItemId::Cash,       "Cash",         1.00},
}};

const std::array<ItemDef, kItemCount>& itemTable() { return kTable; }

const ItemDef& itemDef(ItemId id) {
  return kTable[static_cast<std::size_t>(id)];
}

std::string_view itemName(ItemId id) {
  return itemDef(id).name;
}

} // namespace frontier::sim
