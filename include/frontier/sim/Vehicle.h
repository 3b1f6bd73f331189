#pragma once

#include "frontier/sim/Item.h"

#include <map>
#include <string>

namespace frontier::sim {

struct InventoryItem {
  std::string name;
  double quantity{0.0};
};

// The player's wagon: how far it rolls per turn, whether it is parked at a
// location, and what it carries. Inventory iterates in item-table order.
class Vehicle {
public:
  Vehicle() = default;

  // Miles covered per travel turn.
  int mileage() const { return m_mileage; }
  void setMileage(int miles);

  bool parked() const { return m_parked; }
  void park() { m_parked = true; }
  void drive() { m_parked = false; }

  int odometer() const { return m_odometer; }
  void addOdometer(int miles);

  const std::map<ItemId, InventoryItem>& inventory() const { return m_inventory; }

  double quantity(ItemId id) const;
  void addItem(ItemId id, double amount);
  // Fails (and changes nothing) if the wagon holds less than `amount`.
  bool removeItem(ItemId id, double amount);

  // Value of everything carried at base prices, cash included.
  double inventoryValue() const;

  void reset();

private:
  int m_mileage{0};
  bool m_parked{false};
  int m_odometer{0};
  std::map<ItemId, InventoryItem> m_inventory;
};

} // namespace frontier::sim
