#pragma once

#include <string>
#include <string_view>

namespace frontier::sim {

// Calendar date of the journey. One travel turn is one day.
struct GameDate {
  int year{1848};
  int month{3}; // 1..12
  int day{1};   // 1..daysInMonth
};

inline bool operator==(const GameDate& a, const GameDate& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const GameDate& a, const GameDate& b) { return !(a == b); }

int daysInMonth(int year, int month);
std::string_view monthName(int month);

bool isValidDate(const GameDate& date);
void advanceDay(GameDate& date);

// "March 1, 1848"
std::string formatDate(const GameDate& date);

} // namespace frontier::sim
