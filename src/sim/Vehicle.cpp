#include "frontier/sim/Vehicle.h"

#include <algorithm>

namespace frontier::sim {

void Vehicle::setMileage(int miles) {
  m_mileage = std::max(0, miles);
}

void Vehicle::addOdometer(int miles) {
  if (miles > 0) m_odometer += miles;
}

double Vehicle::quantity(ItemId id) const {
  const auto it = m_inventory.find(id);
  return it == m_inventory.end() ? 0.0 : it->second.quantity;
}

void Vehicle::addItem(ItemId id, double amount) {
  if (amount < 0.0) return;
  auto [it, inserted] = m_inventory.try_emplace(id);
  if (inserted) it->second.name = std::string(itemName(id));
  it->second.quantity += amount;
}

bool Vehicle::removeItem(ItemId id, double amount) {
  const auto it = m_inventory.find(id);
  if (amount < 0.0 || it == m_inventory.end() || it->second.quantity < amount) return false;
  it->second.quantity -= amount;
  return true;
}

double Vehicle::inventoryValue() const {
  double total = 0.0;
  for (const auto& [id, item] : m_inventory) {
    total += item.quantity * itemDef(id).basePrice;
  }
  return total;
}

void Vehicle::reset() {
  m_mileage = 0;
  m_parked = false;
  m_odometer = 0;
  m_inventory.clear();
}

} // namespace frontier::sim
