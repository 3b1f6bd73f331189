#pragma once

#include <optional>
#include <string_view>

namespace frontier::game {

// Strips surrounding spaces, tabs and line endings.
std::string_view trimInput(std::string_view input);

// The whole (trimmed) line must be a decimal integer, optionally signed.
// Anything else ("abc", "2x", "") yields nullopt.
std::optional<int> parseChoice(std::string_view input);

} // namespace frontier::game
