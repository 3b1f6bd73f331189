#include "frontier/sim/GameDate.h"

#include <array>

namespace frontier::sim {
namespace {
  bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  }

  constexpr std::array<std::string_view, 12> kMonthNames = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December",
  };
} // namespace

int daysInMonth(int year, int month) {
  static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && isLeapYear(year)) return 29;
  return kDays[static_cast<std::size_t>(month - 1)];
}

std::string_view monthName(int month) {
  if (month < 1 || month > 12) return "?";
  return kMonthNames[static_cast<std::size_t>(month - 1)];
}

bool isValidDate(const GameDate& date) {
  return date.month >= 1 && date.month <= 12 && date.day >= 1
      && date.day <= daysInMonth(date.year, date.month);
}

void advanceDay(GameDate& date) {
  if (++date.day <= daysInMonth(date.year, date.month)) return;
  date.day = 1;
  if (++date.month <= 12) return;
  date.month = 1;
  ++date.year;
}

std::string formatDate(const GameDate& date) {
  return std::string(monthName(date.month)) + " " + std::to_string(date.day) + ", "
       + std::to_string(date.year);
}

} // namespace frontier::sim
