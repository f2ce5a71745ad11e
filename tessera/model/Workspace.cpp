#include "Workspace.h"

namespace Tessera {

Table &Workspace::addTable(std::string name, std::string imagePath) {
  if (Table *existing = findTable(name)) {
    existing->imagePath = std::move(imagePath);
    return *existing;
  }
  auto t = std::make_unique<Table>();
  t->name = std::move(name);
  t->imagePath = std::move(imagePath);
  m_tables.push_back(std::move(t));
  return *m_tables.back();
}

Table *Workspace::findTable(std::string_view name) {
  for (auto &t : m_tables) {
    if (t->name == name)
      return t.get();
  }
  return nullptr;
}

const Table *Workspace::findTable(std::string_view name) const {
  for (const auto &t : m_tables) {
    if (t->name == name)
      return t.get();
  }
  return nullptr;
}

void Workspace::clear() {
  m_tables.clear();
  m_extras.clear();
}

} // namespace Tessera
