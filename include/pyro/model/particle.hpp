#pragma once

#include "pyro/model/color.hpp"
#include "pyro/pyro_types.hpp"

namespace pyro::view {
class RenderSurface;
}

namespace pyro::model {

class Particle {
 public:
  Particle(core::Vec2 position, core::Extent dimensions, Rgb color);

  Particle &withFading(double fading);
  Particle &withVelocity(double x, double y);
  Particle &withAcceleration(double x, double y);

  // Semi-implicit Euler: velocity first, then position with the new velocity.
  void update();
  void draw(view::RenderSurface &surface) const;

  [[nodiscard]] bool isDead() const { return m_lifetime <= 0.0; }

  [[nodiscard]] core::Vec2 position() const { return m_position; }
  [[nodiscard]] core::Vec2 velocity() const { return m_velocity; }
  [[nodiscard]] core::Vec2 acceleration() const { return m_acceleration; }
  [[nodiscard]] core::Extent dimensions() const { return m_dimensions; }
  [[nodiscard]] double lifetime() const { return m_lifetime; }
  [[nodiscard]] double fading() const { return m_fading; }
  [[nodiscard]] Rgb color() const { return m_color; }

 private:
  core::Vec2 m_position;
  core::Extent m_dimensions;
  core::Vec2 m_velocity{};
  core::Vec2 m_acceleration{};
  double m_lifetime{1.0};
  double m_fading{0.01};
  Rgb m_color;
};

}  // namespace pyro::model
