#include "pyro/model/particle.hpp"

#include <cmath>
#include <cstdint>

#include "pyro/view/render_surface.hpp"

namespace pyro::model {

Particle::Particle(core::Vec2 position, core::Extent dimensions, Rgb color)
    : m_position(position), m_dimensions(dimensions), m_color(color) {}

Particle &Particle::withFading(double fading) {
  m_fading = fading;
  return *this;
}

Particle &Particle::withVelocity(double x, double y) {
  m_velocity = {x, y};
  return *this;
}

Particle &Particle::withAcceleration(double x, double y) {
  m_acceleration = {x, y};
  return *this;
}

void Particle::update() {
  if (isDead()) return;
  m_velocity += m_acceleration;
  m_lifetime -= m_fading;
  m_position += m_velocity;
}

void Particle::draw(view::RenderSurface &surface) const {
  if (isDead()) return;
  surface.filledRect(static_cast<std::int64_t>(std::round(m_position.x)),
                     static_cast<std::int64_t>(std::round(m_position.y)), m_dimensions.width,
                     m_dimensions.height, m_color.scaled(m_lifetime));
}

}  // namespace pyro::model
