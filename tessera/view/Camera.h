#pragma once

#include "math/Vector2.h"

#include <optional>
#include <variant>

namespace Tessera {

struct CameraTuning final {
  float speed = 10000.0f;        // screen px/s^2 of held-key acceleration
  float damping = 0.001f;        // velocity factor retained after 1s
  float zoomBase = 10000.0f;     // > 1
  float zoomRate = 0.99f;        // in (0, 1)
  float easingDuration = 1.0f;   // seconds
};

// Velocity/acceleration driven motion (held keys).
struct InertialMotion final {
  Vector2 velocity{};
  Vector2 acceleration{};
};

// Time-bounded ease-out from start to target (navigation commands).
struct EasingMotion final {
  Vector2 start{};
  Vector2 target{};
  float elapsed = 0.0f;
};

using CameraMotion = std::variant<InertialMotion, EasingMotion>;

// 2D editor camera. position is the world point shown at the viewport
// center; zoom is screen pixels per world pixel and always > 0.
class Camera final {
public:
  Camera() = default;
  explicit Camera(const CameraTuning &tuning) : m_tuning(tuning) {}

  // Advance one frame: zoom smoothing, then easing or inertial integration.
  void tick(float dt);

  // Start a new ease toward target, dropping any velocity or previous ease.
  void easeTo(const Vector2 &target);

  // Leave easing, keeping the apparent velocity of the last frame.
  void releaseEasing();

  const Vector2 &position() const { return m_position; }
  void setPosition(const Vector2 &p) { m_position = p; }

  float zoom() const { return m_zoom; }
  float targetZoom() const { return m_targetZoom; }
  // Non-positive requests are ignored.
  void setTargetZoom(float z);
  // Snap both current and target zoom (session restore).
  void resetZoom(float z);

  const CameraMotion &motion() const { return m_motion; }
  bool isEasing() const {
    return std::holds_alternative<EasingMotion>(m_motion);
  }
  std::optional<Vector2> easingTarget() const;

  // Zero while easing.
  Vector2 velocity() const;
  Vector2 acceleration() const;

  // No effect while easing; acceleration is held at zero there.
  void setVelocity(const Vector2 &v);
  void setAccelerationX(float ax);
  void setAccelerationY(float ay);

  const Vector2 &lastPosition() const { return m_lastPosition; }
  float lastDt() const { return m_lastDt; }

  const CameraTuning &tuning() const { return m_tuning; }

private:
  CameraTuning m_tuning{};

  Vector2 m_position{};
  CameraMotion m_motion{InertialMotion{}};
  float m_zoom = 1.0f;
  float m_targetZoom = 1.0f;

  Vector2 m_lastPosition{};
  float m_lastDt = 0.0f; // 0 = no frame observed yet
};

} // namespace Tessera
