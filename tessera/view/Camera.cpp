#include "Camera.h"

#include "core/Log.h"

#include <cmath>

namespace Tessera {

void Camera::tick(float dt) {
  // Exponential approach, independent of frame rate.
  m_zoom += (m_targetZoom - m_zoom) *
            (1.0f - std::pow(m_tuning.zoomBase, -m_tuning.zoomRate * dt));

  m_lastPosition = m_position;
  m_lastDt = dt;

  if (auto *ease = std::get_if<EasingMotion>(&m_motion)) {
    if (ease->elapsed > m_tuning.easingDuration ||
        m_tuning.easingDuration <= 0.0f) {
      m_position = ease->target;
      m_motion = InertialMotion{};
      return;
    }
    const float progress = ease->elapsed / m_tuning.easingDuration;
    m_position = ease->start + (ease->target - ease->start) *
                                   (1.0f - std::exp2(-10.0f * progress));
    ease->elapsed += dt;
    // Land on the target in the frame the duration runs out, whatever the
    // step sizes were.
    if (ease->elapsed >= m_tuning.easingDuration) {
      m_position = ease->target;
      m_motion = InertialMotion{};
    }
    return;
  }

  auto &in = std::get<InertialMotion>(m_motion);
  m_position += in.velocity * dt;
  in.velocity += in.acceleration * dt;
  in.velocity *= std::pow(m_tuning.damping, dt);
}

void Camera::easeTo(const Vector2 &target) {
  m_motion = EasingMotion{m_position, target, 0.0f};
}

void Camera::releaseEasing() {
  if (!isEasing())
    return;

  InertialMotion in{};
  if (m_lastDt > 0.0f)
    in.velocity = (m_position - m_lastPosition) / m_lastDt;
  m_motion = in;
}

void Camera::setTargetZoom(float z) {
  if (!(z > 0.0f)) {
    Log::Warn("Ignoring non-positive target zoom {}", z);
    return;
  }
  m_targetZoom = z;
}

void Camera::resetZoom(float z) {
  if (!(z > 0.0f))
    return;
  m_zoom = z;
  m_targetZoom = z;
}

std::optional<Vector2> Camera::easingTarget() const {
  if (const auto *ease = std::get_if<EasingMotion>(&m_motion))
    return ease->target;
  return std::nullopt;
}

Vector2 Camera::velocity() const {
  if (const auto *in = std::get_if<InertialMotion>(&m_motion))
    return in->velocity;
  return {};
}

Vector2 Camera::acceleration() const {
  if (const auto *in = std::get_if<InertialMotion>(&m_motion))
    return in->acceleration;
  return {};
}

void Camera::setVelocity(const Vector2 &v) {
  if (auto *in = std::get_if<InertialMotion>(&m_motion))
    in->velocity = v;
}

void Camera::setAccelerationX(float ax) {
  if (auto *in = std::get_if<InertialMotion>(&m_motion))
    in->acceleration.x = ax;
}

void Camera::setAccelerationY(float ay) {
  if (auto *in = std::get_if<InertialMotion>(&m_motion))
    in->acceleration.y = ay;
}

} // namespace Tessera
