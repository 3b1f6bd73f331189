#pragma once

#include <string>

namespace frontier::game {

// Whole count with thousands grouping: 1200.4 -> "1,200".
std::string formatCount(double quantity);

// Dollars with cents and thousands grouping: 1234.5 -> "$1,234.50", -5 -> "-$5.00".
std::string formatCurrency(double amount);

} // namespace frontier::game
