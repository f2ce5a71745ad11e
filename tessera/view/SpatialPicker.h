#pragma once

#include "math/Vector2.h"
#include "model/Element.h"

#include <cstddef>
#include <optional>
#include <span>

namespace Tessera {

// Hit box of an element, inset half a pixel into its 48x48 icon.
inline constexpr Vector2 HitBoxMin{0.5f, 0.5f};
inline constexpr Vector2 HitBoxMax{47.5f, 47.5f};
// Offset from an element's position to the center of its icon.
inline constexpr Vector2 ElementCenter{ElementSize / 2.0f, ElementSize / 2.0f};

bool hitsElement(const Vector2 &world, const Element &element);

// Index of the element under world, or nullopt. When boxes overlap the last
// match in table order is returned.
std::optional<size_t> hitTest(const Vector2 &world,
                              std::span<const Element> elements);

// Index of the element whose position is closest to reference. Ties keep the
// first index. nullopt when elements is empty.
std::optional<size_t> nearest(const Vector2 &reference,
                              std::span<const Element> elements);

// (index + offset) mod count, never negative. count must be > 0.
size_t advance(size_t index, int offset, size_t count);

} // namespace Tessera
