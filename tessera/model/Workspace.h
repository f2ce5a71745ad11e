#pragma once

#include "Element.h"
#include "Table.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Tessera {

// Everything loaded from one elements file: the tables (in file order) and
// the extra elements whose icons are stored as standalone images.
class Workspace final {
public:
  Table &addTable(std::string name, std::string imagePath);
  Table *findTable(std::string_view name);
  const Table *findTable(std::string_view name) const;

  // Stable across addTable() calls.
  const std::vector<std::unique_ptr<Table>> &tables() const { return m_tables; }

  std::vector<ElementRecord> &extras() { return m_extras; }
  const std::vector<ElementRecord> &extras() const { return m_extras; }

  void clear();

private:
  std::vector<std::unique_ptr<Table>> m_tables;
  std::vector<ElementRecord> m_extras;
};

} // namespace Tessera
