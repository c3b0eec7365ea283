#include "pyro/model/simulation_state.hpp"

#include <cstdint>
#include <numeric>
#include <utility>

#include "pyro/model/core/random.hpp"
#include "pyro/view/render_surface.hpp"

namespace pyro::model {

SimulationState::SimulationState(engine::SimulationConfig cfg) : m_cfg(std::move(cfg)) {}

void SimulationState::update(random::RandomSource &rng, core::SurfaceSize surface) {
  reap();
  maybeSpawn(rng, surface);

  for (auto &firework : m_fireworks) firework.update(rng, m_cfg);
}

void SimulationState::reap() {
  std::erase_if(m_fireworks, [](const Firework &f) { return f.isDead(); });
}

void SimulationState::maybeSpawn(random::RandomSource &rng, core::SurfaceSize surface) {
  if (!(rng.uniform() < m_cfg.spawnProbability)) return;
  if (surface.width == 0) return;

  const auto x = static_cast<std::int64_t>(rng.nextU32() % surface.width);
  const auto y = static_cast<std::int64_t>(surface.height);
  const double ySpeed = m_cfg.minLaunchSpeed - rng.uniform() * m_cfg.launchSpeedRange;

  const std::uint8_t r = rng.nextByte();
  const std::uint8_t g = rng.nextByte();
  const std::uint8_t b = rng.nextByte();

  m_fireworks.emplace_back(x, y, ySpeed, Rgb{r, g, b}, m_cfg);
}

void SimulationState::render(view::RenderSurface &surface) const {
  surface.clear(BLACK);
  for (const auto &firework : m_fireworks) firework.draw(surface);
}

void SimulationState::launch(Firework firework) {
  m_fireworks.push_back(std::move(firework));
}

std::size_t SimulationState::liveParticleCount() const {
  return std::accumulate(m_fireworks.begin(), m_fireworks.end(), std::size_t{0},
                         [](std::size_t acc, const Firework &f) { return acc + f.liveParticleCount(); });
}

}  // namespace pyro::model
