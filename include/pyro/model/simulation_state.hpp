#pragma once

#include <cstddef>
#include <vector>

#include "pyro/engine/config.hpp"
#include "pyro/model/firework.hpp"
#include "pyro/pyro_types.hpp"

namespace pyro::model {

class SimulationState {
 public:
  explicit SimulationState(engine::SimulationConfig cfg = {});

  /**
   * One tick, in this order:
   *  1. reap every dead firework
   *  2. one spawn trial with cfg.spawnProbability
   *  3. advance every remaining firework
   */
  void update(random::RandomSource &rng, core::SurfaceSize surface);

  // Clears to black, later fireworks draw on top.
  void render(view::RenderSurface &surface) const;

  // Direct insertion, bypasses the spawn trial.
  void launch(Firework firework);

  [[nodiscard]] const std::vector<Firework> &fireworks() const { return m_fireworks; }
  [[nodiscard]] std::size_t size() const { return m_fireworks.size(); }
  [[nodiscard]] bool empty() const noexcept { return m_fireworks.empty(); }
  [[nodiscard]] std::size_t liveParticleCount() const;
  [[nodiscard]] const engine::SimulationConfig &config() const { return m_cfg; }

 private:
  void reap();
  void maybeSpawn(random::RandomSource &rng, core::SurfaceSize surface);

  engine::SimulationConfig m_cfg;
  std::vector<Firework> m_fireworks;
};

}  // namespace pyro::model
