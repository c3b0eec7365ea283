#pragma once
#include <cstdint>

namespace pyro::core {

struct Vec2 {
  double x = 0.0;
  double y = 0.0;

  constexpr Vec2 &operator+=(const Vec2 &o) noexcept {
    x += o.x;
    y += o.y;
    return *this;
  }
};

// Logical pixel grid of a render surface.
struct SurfaceSize {
  unsigned width = 0;
  unsigned height = 0;
};

struct Extent {
  std::uint32_t width = 1;
  std::uint32_t height = 1;
};

}  // namespace pyro::core
