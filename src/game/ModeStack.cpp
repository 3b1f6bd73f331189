#include "frontier/game/ModeStack.h"

#include <utility>

namespace frontier::game {

void ModeStack::push(sim::ModeId mode, std::unique_ptr<Form> form) {
  ++m_runCounts[static_cast<std::size_t>(mode)];

  if (!m_entries.empty() && m_entries.back().mode == mode) {
    m_entries.back().form = std::move(form);
    return;
  }
  m_entries.push_back(Entry{mode, std::move(form)});
}

bool ModeStack::pop() {
  if (m_entries.empty()) return false;
  m_entries.pop_back();
  return true;
}

bool ModeStack::setForm(std::unique_ptr<Form> form) {
  if (m_entries.empty()) return false;
  m_entries.back().form = std::move(form);
  return true;
}

bool ModeStack::contains(sim::ModeId mode) const {
  for (const auto& e : m_entries) {
    if (e.mode == mode) return true;
  }
  return false;
}

unsigned ModeStack::runCount(sim::ModeId mode) const {
  return m_runCounts[static_cast<std::size_t>(mode)];
}

void ModeStack::clear() {
  m_entries.clear();
  m_runCounts.fill(0);
}

} // namespace frontier::game
