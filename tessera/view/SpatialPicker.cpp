#include "SpatialPicker.h"

#include <limits>

namespace Tessera {

bool hitsElement(const Vector2 &world, const Element &element) {
  return world.within(element.position + HitBoxMin,
                      element.position + HitBoxMax);
}

std::optional<size_t> hitTest(const Vector2 &world,
                              std::span<const Element> elements) {
  std::optional<size_t> hit;
  for (size_t i = 0; i < elements.size(); ++i) {
    if (hitsElement(world, elements[i]))
      hit = i;
  }
  return hit;
}

std::optional<size_t> nearest(const Vector2 &reference,
                              std::span<const Element> elements) {
  std::optional<size_t> best;
  float bestDist = std::numeric_limits<float>::infinity();
  for (size_t i = 0; i < elements.size(); ++i) {
    const float d = distance(elements[i].position, reference);
    if (d < bestDist) {
      bestDist = d;
      best = i;
    }
  }
  return best;
}

size_t advance(size_t index, int offset, size_t count) {
  if (count == 0)
    return 0;
  const long long n = (long long)count;
  long long r = ((long long)index + (long long)offset) % n;
  if (r < 0)
    r += n;
  return (size_t)r;
}

} // namespace Tessera
