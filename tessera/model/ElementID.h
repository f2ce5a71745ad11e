#pragma once

#include <cstdint>

namespace Tessera {

// ElementID = 32-bit (slot index) + 32-bit (generation)
struct ElementID final {
  uint32_t index = 0;
  uint32_t generation = 0;

  constexpr bool operator==(const ElementID &o) const {
    return index == o.index && generation == o.generation;
  }
  constexpr bool operator!=(const ElementID &o) const { return !(*this == o); }
  constexpr explicit operator bool() const { return generation != 0; }
};

inline constexpr ElementID InvalidElement{0u, 0u};

} // namespace Tessera
