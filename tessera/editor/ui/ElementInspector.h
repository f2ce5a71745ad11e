#pragma once

#include "model/ElementID.h"

namespace Tessera {

struct Table;

// Editor window for the active element. Returns true when anything changed,
// including removal.
class ElementInspector final {
public:
  bool draw(Table &table, ElementID &active);
};

} // namespace Tessera
