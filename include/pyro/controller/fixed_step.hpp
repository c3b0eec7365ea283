#pragma once

#include "pyro/constants.hpp"

namespace pyro::controller {

// Turns wall-clock frame deltas into a whole number of fixed simulation ticks.
class FixedStep {
 public:
  // Throws std::invalid_argument unless tickRate > 0 and maxCatchUp > 0.
  explicit FixedStep(int tickRate, int maxCatchUp = core::MAX_CATCH_UP_TICKS);

  /**
   * Adds dt seconds and returns how many ticks to run now. The remainder below one
   * tick carries into the next call; a backlog beyond maxCatchUp ticks is dropped.
   * Returns 0 once stopped.
   */
  int advance(double dt);

  void stop();

  [[nodiscard]] bool running() const { return m_running; }
  [[nodiscard]] double accumulated() const { return m_accumulator; }
  [[nodiscard]] double tickSeconds() const { return m_tick_seconds; }

 private:
  double m_tick_seconds;
  int m_max_catch_up;
  double m_accumulator{0.0};
  bool m_running{true};
};

}  // namespace pyro::controller
