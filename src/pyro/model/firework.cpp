#include "pyro/model/firework.hpp"

#include <algorithm>
#include <cmath>

#include "pyro/model/core/random.hpp"

namespace pyro::model {

namespace {

constexpr core::Extent ROCKET_EXTENT{1, 3};
constexpr core::Extent SPARK_EXTENT{1, 1};

// U in [0,1) mapped onto [-range, +range)
double jitter(random::RandomSource &rng, double range) {
  return (rng.uniform() - 0.5) * 2.0 * range;
}

}  // namespace

Firework::Firework(std::int64_t x, std::int64_t y, double ySpeed, Rgb seedColor,
                   const engine::SimulationConfig &cfg)
    : m_phase(Ascending{Particle({static_cast<double>(x), static_cast<double>(y)}, ROCKET_EXTENT,
                                 WHITE)
                            .withAcceleration(0.0, cfg.gravity)
                            .withVelocity(0.0, ySpeed)
                            .withFading(0.0)}),
      m_base_color(toHsl(seedColor)) {}

void Firework::update(random::RandomSource &rng, const engine::SimulationConfig &cfg) {
  if (auto *ascending = std::get_if<Ascending>(&m_phase)) {
    ascending->rocket.update();
    if (ascending->rocket.velocity().y > cfg.detonationSpeed) {
      spawnBurst(ascending->rocket, rng, cfg);
      m_phase = Exploded{};
    }
  }

  for (auto &particle : m_effect) particle.update();
}

void Firework::spawnBurst(const Particle &rocket, random::RandomSource &rng,
                          const engine::SimulationConfig &cfg) {
  const core::Vec2 origin{std::round(rocket.position().x), std::round(rocket.position().y)};

  m_effect.reserve(m_effect.size() + cfg.burstSize);
  for (std::size_t i = 0; i < cfg.burstSize; ++i) {
    const Rgb color = jitteredColor(rng, cfg);
    const double vx = cfg.burstSpreadX * (rng.uniform() - cfg.burstBiasX);
    const double vy = cfg.burstSpreadY * (rng.uniform() - cfg.burstBiasY);

    m_effect.push_back(Particle(origin, SPARK_EXTENT, color)
                           .withAcceleration(0.0, cfg.gravity)
                           .withVelocity(vx, vy)
                           .withFading(cfg.effectFading));
  }
}

Rgb Firework::jitteredColor(random::RandomSource &rng, const engine::SimulationConfig &cfg) const {
  const double s = std::clamp(m_base_color.s + jitter(rng, cfg.saturationJitter), 0.0, 100.0);
  const double l = std::clamp(m_base_color.l + jitter(rng, cfg.lightnessJitter), 0.0, 100.0);
  return toRgb(Hsl{m_base_color.h, s, l});
}

void Firework::draw(view::RenderSurface &surface) const {
  if (const Particle *r = rocket()) r->draw(surface);
  for (const auto &particle : m_effect) particle.draw(surface);
}

bool Firework::isDead() const {
  return exploded() &&
         std::all_of(m_effect.begin(), m_effect.end(), [](const Particle &p) { return p.isDead(); });
}

const Particle *Firework::rocket() const {
  if (const auto *ascending = std::get_if<Ascending>(&m_phase)) return &ascending->rocket;
  return nullptr;
}

std::size_t Firework::liveParticleCount() const {
  const auto sparks = static_cast<std::size_t>(
      std::count_if(m_effect.begin(), m_effect.end(), [](const Particle &p) { return !p.isDead(); }));
  return sparks + (exploded() ? 0 : 1);
}

}  // namespace pyro::model
