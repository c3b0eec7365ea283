#pragma once

#include <cstdint>

#include "pyro/model/color.hpp"
#include "pyro/pyro_types.hpp"

namespace pyro::view {

/**
 * Pixel surface the simulation draws into. Coordinates are logical pixels,
 * anything outside [0,width) x [0,height) is clipped by the backend.
 */
class RenderSurface {
 public:
  virtual ~RenderSurface() = default;

  virtual void clear(const model::Rgb &color) = 0;
  virtual void filledRect(std::int64_t x, std::int64_t y, std::uint32_t width,
                          std::uint32_t height, const model::Rgb &color) = 0;

  [[nodiscard]] virtual core::SurfaceSize size() const = 0;
};

}  // namespace pyro::view
