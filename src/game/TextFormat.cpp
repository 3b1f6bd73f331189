#include "frontier/game/TextFormat.h"

#include <cmath>
#include <cstdio>

namespace frontier::game {
namespace {
  std::string groupThousands(unsigned long long v) {
    std::string digits = std::to_string(v);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
      if (i != 0 && (i % 3) == lead) out.push_back(',');
      out.push_back(digits[i]);
    }
    return out;
  }
} // namespace

std::string formatCount(double quantity) {
  const long long whole = std::llround(quantity);
  const std::string grouped = groupThousands(static_cast<unsigned long long>(whole < 0 ? -whole : whole));
  return whole < 0 ? "-" + grouped : grouped;
}

std::string formatCurrency(double amount) {
  const long long cents = std::llround(amount * 100.0);
  const unsigned long long absCents = static_cast<unsigned long long>(cents < 0 ? -cents : cents);

  char frac[4];
  std::snprintf(frac, sizeof(frac), "%02llu", absCents % 100);

  const std::string body = "$" + groupThousands(absCents / 100) + "." + frac;
  return cents < 0 ? "-" + body : body;
}

} // namespace frontier::game
