#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "pyro/engine/config.hpp"
#include "pyro/model/color.hpp"
#include "pyro/model/particle.hpp"

namespace pyro::model {

namespace random {
class RandomSource;
}

/**
 * A rocket that climbs until gravity slows it past the detonation speed, then
 * turns into a burst of effect particles that fade out on their own.
 */
class Firework {
 public:
  struct Ascending {
    Particle rocket;
  };
  struct Exploded {};
  using Phase = std::variant<Ascending, Exploded>;

  Firework(std::int64_t x, std::int64_t y, double ySpeed, Rgb seedColor,
           const engine::SimulationConfig &cfg = engine::SimulationConfig{});

  void update(random::RandomSource &rng, const engine::SimulationConfig &cfg);
  void draw(view::RenderSurface &surface) const;

  [[nodiscard]] bool isDead() const;
  [[nodiscard]] bool exploded() const { return std::holds_alternative<Exploded>(m_phase); }

  // nullptr once exploded
  [[nodiscard]] const Particle *rocket() const;
  [[nodiscard]] const std::vector<Particle> &effect() const { return m_effect; }
  [[nodiscard]] const Hsl &baseColor() const { return m_base_color; }
  [[nodiscard]] std::size_t liveParticleCount() const;

 private:
  void spawnBurst(const Particle &rocket, random::RandomSource &rng,
                  const engine::SimulationConfig &cfg);
  [[nodiscard]] Rgb jitteredColor(random::RandomSource &rng,
                                  const engine::SimulationConfig &cfg) const;

  Phase m_phase;
  std::vector<Particle> m_effect;
  Hsl m_base_color;
};

}  // namespace pyro::model
