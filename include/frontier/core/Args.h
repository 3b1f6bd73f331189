#pragma once

#include <algorithm>
#include <charconv>
#include <cctype>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace frontier::core {

// Command line options of the frontends.
//
//  --flag            switch
//  --key value       option (also --key=value); repeated keys keep the last value
//  -h                short switches, may be grouped
//
// A long option followed by another switch, or by nothing, is a switch.
// Negative numbers ("--events -1") are taken as values.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  void parse(int argc, char** argv) {
    m_values.clear();
    m_flags.clear();
    m_stray.clear();

    for (int i = 1; i < argc; ++i) {
      const std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view();
      if (a.empty()) continue;

      if (a.substr(0, 2) == "--") {
        const std::string_view body = a.substr(2);
        const auto eq = body.find('=');
        if (eq != std::string_view::npos) {
          m_values[std::string(body.substr(0, eq))] = std::string(body.substr(eq + 1));
        } else if (i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
          m_values[std::string(body)] = argv[++i];
        } else {
          m_flags.emplace_back(body);
        }
      } else if (a.front() == '-' && a.size() > 1) {
        for (const char c : a.substr(1)) {
          if (std::isalnum(static_cast<unsigned char>(c))) m_flags.emplace_back(1, c);
        }
      } else {
        m_stray.emplace_back(a);
      }
    }
  }

  bool hasFlag(std::string_view key) const {
    return std::find(m_flags.begin(), m_flags.end(), key) != m_flags.end();
  }

  bool has(std::string_view key) const {
    return hasFlag(key) || m_values.count(std::string(key)) != 0;
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = m_values.find(std::string(key));
    if (it == m_values.end()) return std::nullopt;
    return it->second;
  }

  // Typed getters leave `out` untouched unless the whole value parses.
  bool getU64(std::string_view key, unsigned long long& out) const { return getNumber(key, out); }
  bool getInt(std::string_view key, int& out) const { return getNumber(key, out); }
  bool getDouble(std::string_view key, double& out) const { return getNumber(key, out); }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

  // Options, switches and bare words not in `known`, as typed ("--speed", "-x", "foo").
  std::vector<std::string> unknown(std::initializer_list<std::string_view> known) const {
    auto isKnown = [&known](std::string_view k) {
      return std::find(known.begin(), known.end(), k) != known.end();
    };

    std::vector<std::string> out;
    for (const auto& [k, v] : m_values) {
      if (!isKnown(k)) out.push_back("--" + k);
    }
    for (const auto& f : m_flags) {
      if (!isKnown(f)) out.push_back((f.size() == 1 ? "-" : "--") + f);
    }
    out.insert(out.end(), m_stray.begin(), m_stray.end());
    return out;
  }

private:
  template <typename T>
  bool getNumber(std::string_view key, T& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;

    T parsed{};
    const char* first = v->data();
    const char* end = v->data() + v->size();
    const auto [ptr, ec] = std::from_chars(first, end, parsed);
    if (ec != std::errc() || ptr != end) return false;
    out = parsed;
    return true;
  }

  static bool isSwitch(const char* s) {
    return s[0] == '-' && s[1] != '\0' && !std::isdigit(static_cast<unsigned char>(s[1]));
  }

  std::map<std::string, std::string> m_values;
  std::vector<std::string> m_flags;
  std::vector<std::string> m_stray;
};

} // namespace frontier::core
