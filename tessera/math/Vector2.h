#pragma once

#include <cmath>

namespace Tessera {

// World/screen pixel coordinates. Plain value type.
struct Vector2 final {
  float x = 0.0f;
  float y = 0.0f;

  constexpr Vector2() = default;
  constexpr Vector2(float x_, float y_) : x(x_), y(y_) {}

  constexpr Vector2 operator+(const Vector2 &o) const {
    return {x + o.x, y + o.y};
  }
  constexpr Vector2 operator-(const Vector2 &o) const {
    return {x - o.x, y - o.y};
  }
  constexpr Vector2 operator*(float s) const { return {x * s, y * s}; }
  constexpr Vector2 operator/(float s) const { return {x / s, y / s}; }

  constexpr Vector2 &operator+=(const Vector2 &o) {
    x += o.x;
    y += o.y;
    return *this;
  }
  constexpr Vector2 &operator-=(const Vector2 &o) {
    x -= o.x;
    y -= o.y;
    return *this;
  }
  constexpr Vector2 &operator*=(float s) {
    x *= s;
    y *= s;
    return *this;
  }

  constexpr bool operator==(const Vector2 &o) const {
    return x == o.x && y == o.y;
  }
  constexpr bool operator!=(const Vector2 &o) const { return !(*this == o); }

  // Half-open rectangle test: a <= p < b on both axes.
  constexpr bool within(const Vector2 &a, const Vector2 &b) const {
    return a.x <= x && x < b.x && a.y <= y && y < b.y;
  }

  Vector2 floor() const { return {std::floor(x), std::floor(y)}; }

  float length() const { return std::sqrt(x * x + y * y); }
};

inline float distance(const Vector2 &a, const Vector2 &b) {
  return (a - b).length();
}

} // namespace Tessera
