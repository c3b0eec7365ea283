#include "pyro/app/app.hpp"

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include <cstdint>
#include <iostream>
#include <utility>

#include "pyro/controller/fixed_step.hpp"
#include "pyro/controller/input_state.hpp"
#include "pyro/engine/config.hpp"
#include "pyro/model/core/random.hpp"
#include "pyro/model/simulation_state.hpp"
#include "pyro/view/sfml_surface.hpp"

namespace pyro::app {

App::App(Options options) : m_options(std::move(options)) {}

int App::run() {
  engine::SimulationConfig cfg;
  cfg.spawnProbability = m_options.spawnProbability;

  model::SimulationState state(cfg);
  model::random::MersenneRandom rng(m_options.seed);
  controller::InputState input;

  const core::SurfaceSize grid{m_options.width, m_options.height};
  sf::RenderWindow window(
      sf::VideoMode(grid.width * m_options.pixelSize, grid.height * m_options.pixelSize), "pyro",
      sf::Style::Titlebar | sf::Style::Close);
  if (m_options.frameLimit > 0) window.setFramerateLimit(static_cast<unsigned>(m_options.frameLimit));

  view::SfmlSurface surface(window, grid, m_options.pixelSize);

  if (m_options.stats) {
    std::cout << "[App] " << core::PYRO_VERSION << " grid=" << grid.width << "x" << grid.height
              << " tickRate=" << m_options.tickRate << " fps=" << m_options.frameLimit << "\n";
  }

  controller::FixedStep stepper(m_options.tickRate);
  std::uint64_t ticks = 0;
  std::uint64_t frames = 0;

  sf::Clock clock;
  sf::Clock statsClock;
  while (window.isOpen()) {
    const double dt = clock.restart().asSeconds();

    sf::Event event;
    while (window.pollEvent(event)) input.processEvent(event);
    if (input.quitRequested()) stepper.stop();

    const int steps = stepper.advance(dt);
    for (int i = 0; i < steps; ++i) state.update(rng, surface.size());
    ticks += static_cast<std::uint64_t>(steps);

    if (!stepper.running()) {
      window.close();
      break;
    }

    state.render(surface);
    surface.present();
    ++frames;

    if (m_options.stats && statsClock.getElapsedTime().asSeconds() >= 1.f) {
      statsClock.restart();
      std::cout << "[App] ticks=" << ticks << " frames=" << frames
                << " fireworks=" << state.size() << " particles=" << state.liveParticleCount()
                << "\n";
      frames = 0;
    }
  }

  if (m_options.stats) std::cout << "[App] quit after " << ticks << " ticks\n";
  return 0;
}

}  // namespace pyro::app
