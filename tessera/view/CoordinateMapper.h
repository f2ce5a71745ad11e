#pragma once

#include "Camera.h"
#include "ViewportState.h"
#include "math/Vector2.h"

namespace Tessera {

// World <-> screen transform for one camera/viewport snapshot.
// With a zero origin this is
//   screen = size/2 - (cam - world) * zoom
//   world  = cam - (size/2 - screen) / zoom
// and the two functions are inverses of each other.
struct CoordinateMapper final {
  Vector2 cameraPosition{};
  float zoom = 1.0f;
  Vector2 viewportSize{1.0f, 1.0f};
  Vector2 viewportOrigin{};

  static CoordinateMapper from(const Camera &camera, const Vector2 &size,
                               const Vector2 &origin = {}) {
    return {camera.position(), camera.zoom(), size, origin};
  }

  static CoordinateMapper from(const Camera &camera,
                               const ViewportState &viewport) {
    return from(camera, viewport.size, viewport.origin);
  }

  Vector2 worldToScreen(const Vector2 &world) const {
    return viewportOrigin + viewportSize / 2.0f -
           (cameraPosition - world) * zoom;
  }

  Vector2 screenToWorld(const Vector2 &screen) const {
    return cameraPosition -
           (viewportSize / 2.0f - (screen - viewportOrigin)) / zoom;
  }
};

} // namespace Tessera
