#include "frontier/game/Input.h"

#include <charconv>

namespace frontier::game {

std::string_view trimInput(std::string_view input) {
  constexpr std::string_view kSpace = " \t\r\n";
  const auto first = input.find_first_not_of(kSpace);
  if (first == std::string_view::npos) return {};
  const auto last = input.find_last_not_of(kSpace);
  return input.substr(first, last - first + 1);
}

std::optional<int> parseChoice(std::string_view input) {
  std::string_view s = trimInput(input);
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;

  int value = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return value;
}

} // namespace frontier::game
