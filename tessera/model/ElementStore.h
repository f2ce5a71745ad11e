#pragma once

#include "Element.h"
#include "ElementID.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace Tessera {

// Ordered element storage with generation-checked handles.
// Iteration order (elements()) is table order; destroy() keeps the relative
// order of the remaining elements. Handles of destroyed elements never
// resolve again, even after their slot is reused.
class ElementStore final {
public:
  ElementID create(Element element);
  bool destroy(ElementID id);
  void clear();

  bool isAlive(ElementID id) const;

  Element *find(ElementID id);
  const Element *find(ElementID id) const;

  std::optional<size_t> indexOf(ElementID id) const;
  ElementID idAt(size_t i) const;

  Element &at(size_t i) { return m_dense[i]; }
  const Element &at(size_t i) const { return m_dense[i]; }

  std::span<Element> elements() { return m_dense; }
  std::span<const Element> elements() const { return m_dense; }

  size_t size() const { return m_dense.size(); }
  bool empty() const { return m_dense.empty(); }

private:
  static constexpr uint32_t NoDense = UINT32_MAX;

  struct Slot final {
    uint32_t generation = 1;
    uint32_t dense = NoDense;
  };

  std::vector<Slot> m_slots;
  std::vector<uint32_t> m_freeSlots;
  std::vector<Element> m_dense;
  std::vector<ElementID> m_denseIds;
};

} // namespace Tessera
