#pragma once

#include "frontier/game/Form.h"
#include "frontier/sim/Mode.h"

#include <array>
#include <memory>
#include <vector>

namespace frontier::game {

// Active game modes, most recent on top. Each mode holds the form currently
// shown for it.
class ModeStack {
public:
  struct Entry {
    sim::ModeId mode{sim::ModeId::Travel};
    std::unique_ptr<Form> form;
  };

  // Pushes `mode` with `form` attached. If `mode` is already on top, only the
  // form is replaced. Either way the mode's run count goes up.
  void push(sim::ModeId mode, std::unique_ptr<Form> form);

  // Removes the top mode. Returns false on an empty stack.
  bool pop();

  // Replaces the form of the top mode. Returns false on an empty stack.
  bool setForm(std::unique_ptr<Form> form);

  Entry* top() { return m_entries.empty() ? nullptr : &m_entries.back(); }
  const Entry* top() const { return m_entries.empty() ? nullptr : &m_entries.back(); }

  bool contains(sim::ModeId mode) const;
  std::size_t size() const { return m_entries.size(); }
  bool empty() const { return m_entries.empty(); }

  unsigned runCount(sim::ModeId mode) const;

  void clear();

private:
  std::vector<Entry> m_entries;
  std::array<unsigned, sim::kModeCount> m_runCounts{};
};

} // namespace frontier::game
