#pragma once

#include "math/Vector2.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Tessera {

// Element icons are 48x48 with a 1px margin on every side.
inline constexpr float ElementSize = 48.0f;
inline constexpr int ElementMargin = 1;

struct ElementInfo final {
  std::string name;
  std::string symbol;
  std::string pronouns;
  std::vector<std::string> authors;
  uint32_t embedColor = 0xFF0000; // 0xRRGGBB
  std::optional<int> atomicNumber;
};

// An element placed on a table. Position is the integer top-left corner in
// canvas pixels.
struct Element final {
  ElementInfo info;
  Vector2 position{};
};

// Where an element's icon comes from.
struct SlicedSource final {
  std::string table;
  Vector2 coordinates{};
};

struct EmbeddedSource final {
  std::string path;
};

using ElementSource = std::variant<SlicedSource, EmbeddedSource>;

struct ElementRecord final {
  ElementInfo info;
  ElementSource source;
};

} // namespace Tessera
