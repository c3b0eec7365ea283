#include "pyro/controller/fixed_step.hpp"

#include <stdexcept>

namespace pyro::controller {

FixedStep::FixedStep(int tickRate, int maxCatchUp) : m_max_catch_up(maxCatchUp) {
  if (tickRate <= 0) throw std::invalid_argument("tick rate must be positive");
  if (maxCatchUp <= 0) throw std::invalid_argument("catch-up limit must be positive");
  m_tick_seconds = 1.0 / static_cast<double>(tickRate);
}

int FixedStep::advance(double dt) {
  if (!m_running) return 0;
  if (dt > 0.0) m_accumulator += dt;

  int ticks = 0;
  while (m_accumulator >= m_tick_seconds) {
    if (ticks == m_max_catch_up) {
      m_accumulator = 0.0;  // too far behind, drop the backlog
      break;
    }
    m_accumulator -= m_tick_seconds;
    ++ticks;
  }
  return ticks;
}

void FixedStep::stop() {
  m_running = false;
}

}  // namespace pyro::controller
