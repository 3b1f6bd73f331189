#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace frontier::core {

// Streaming JSON writer used for the status report.
// Keys and values are written as they come; scopes must be closed in order.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = true, int indentSpaces = 2)
      : m_out(out), m_pretty(pretty), m_indentSpaces(indentSpaces) {}

  void beginObject() { open('{'); }
  void endObject() { close('}'); }

  void beginArray() { open('['); }
  void endArray() { close(']'); }

  void key(std::string_view k) {
    separate();
    writeString(k);
    m_out << (m_pretty ? ": " : ":");
    m_afterKey = true;
  }

  void value(std::string_view s) {
    separate();
    writeString(s);
  }
  void value(const char* s) { value(std::string_view(s ? s : "")); }
  void value(const std::string& s) { value(std::string_view(s)); }

  void value(double v) {
    separate();
    m_out << v;
  }
  void value(long long v) {
    separate();
    m_out << v;
  }
  void value(unsigned long long v) {
    separate();
    m_out << v;
  }
  void value(int v) { value(static_cast<long long>(v)); }
  void value(bool v) {
    separate();
    m_out << (v ? "true" : "false");
  }
  void nullValue() {
    separate();
    m_out << "null";
  }

  // Shorthand for key(k) + value(v).
  template <typename T>
  void field(std::string_view k, const T& v) {
    key(k);
    value(v);
  }

private:
  struct Frame {
    char closer{'}'};
    bool first{true};
  };

  void open(char opener) {
    separate();
    m_out << opener;
    m_stack.push_back(Frame{opener == '{' ? '}' : ']', true});
  }

  void close(char closer) {
    if (m_stack.empty() || m_stack.back().closer != closer) return;

    const bool wasEmpty = m_stack.back().first;
    m_stack.pop_back();
    if (m_pretty && !wasEmpty) {
      m_out << "\n";
      indent();
    }
    m_out << closer;
  }

  // Emits the comma/newline/indent that precedes a value or key.
  void separate() {
    if (m_afterKey) {
      m_afterKey = false;
      return;
    }
    if (m_stack.empty()) return;

    auto& f = m_stack.back();
    if (!f.first) m_out << ',';
    f.first = false;
    if (m_pretty) {
      m_out << "\n";
      indent();
    }
  }

  void indent() {
    const int n = static_cast<int>(m_stack.size()) * m_indentSpaces;
    for (int i = 0; i < n; ++i) m_out << ' ';
  }

  void writeString(std::string_view s) {
    static const char* kHex = "0123456789abcdef";
    m_out << '"';
    for (const char c : s) {
      switch (c) {
        case '"':  m_out << "\\\""; break;
        case '\\': m_out << "\\\\"; break;
        case '\n': m_out << "\\n"; break;
        case '\r': m_out << "\\r"; break;
        case '\t': m_out << "\\t"; break;
        default: {
          const auto uc = static_cast<unsigned char>(c);
          if (uc < 0x20) {
            m_out << "\\u00" << kHex[(uc >> 4) & 0xF] << kHex[uc & 0xF];
          } else {
            m_out << c;
          }
          break;
        }
      }
    }
    m_out << '"';
  }

  std::ostream& m_out;
  bool m_pretty{true};
  int m_indentSpaces{2};
  bool m_afterKey{false};
  std::vector<Frame> m_stack;
};

} // namespace frontier::core
