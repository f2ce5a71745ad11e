#include "ElementStore.h"

namespace Tessera {

ElementID ElementStore::create(Element element) {
  uint32_t slotIndex = 0;
  if (!m_freeSlots.empty()) {
    slotIndex = m_freeSlots.back();
    m_freeSlots.pop_back();
  } else {
    slotIndex = (uint32_t)m_slots.size();
    m_slots.push_back(Slot{});
  }

  Slot &slot = m_slots[slotIndex];
  slot.dense = (uint32_t)m_dense.size();

  const ElementID id{slotIndex, slot.generation};
  m_dense.push_back(std::move(element));
  m_denseIds.push_back(id);
  return id;
}

bool ElementStore::destroy(ElementID id) {
  if (!isAlive(id))
    return false;

  Slot &slot = m_slots[id.index];
  const uint32_t d = slot.dense;

  m_dense.erase(m_dense.begin() + (ptrdiff_t)d);
  m_denseIds.erase(m_denseIds.begin() + (ptrdiff_t)d);
  for (size_t i = d; i < m_denseIds.size(); ++i)
    m_slots[m_denseIds[i].index].dense = (uint32_t)i;

  slot.dense = NoDense;
  if (++slot.generation == 0)
    slot.generation = 1;
  m_freeSlots.push_back(id.index);
  return true;
}

void ElementStore::clear() {
  for (const ElementID id : m_denseIds) {
    Slot &slot = m_slots[id.index];
    slot.dense = NoDense;
    if (++slot.generation == 0)
      slot.generation = 1;
    m_freeSlots.push_back(id.index);
  }
  m_dense.clear();
  m_denseIds.clear();
}

bool ElementStore::isAlive(ElementID id) const {
  if (!id || id.index >= m_slots.size())
    return false;
  const Slot &slot = m_slots[id.index];
  return slot.generation == id.generation && slot.dense != NoDense;
}

Element *ElementStore::find(ElementID id) {
  if (!isAlive(id))
    return nullptr;
  return &m_dense[m_slots[id.index].dense];
}

const Element *ElementStore::find(ElementID id) const {
  if (!isAlive(id))
    return nullptr;
  return &m_dense[m_slots[id.index].dense];
}

std::optional<size_t> ElementStore::indexOf(ElementID id) const {
  if (!isAlive(id))
    return std::nullopt;
  return (size_t)m_slots[id.index].dense;
}

ElementID ElementStore::idAt(size_t i) const {
  if (i >= m_denseIds.size())
    return InvalidElement;
  return m_denseIds[i];
}

} // namespace Tessera
