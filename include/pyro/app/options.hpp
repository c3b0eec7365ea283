#pragma once
#include <cstdint>
#include <iosfwd>

#include "pyro/constants.hpp"

namespace pyro::app {

struct Options {
  unsigned width = core::DEFAULT_GRID_WIDTH;
  unsigned height = core::DEFAULT_GRID_HEIGHT;
  unsigned pixelSize = core::DEFAULT_PIXEL_SIZE;

  int tickRate = core::DEFAULT_TICK_RATE;
  int frameLimit = core::DEFAULT_FRAME_LIMIT;  // 0 => unlimited

  double spawnProbability = 0.10;
  std::uint64_t seed = 0;  // 0 => nondeterministic

  bool stats = false;
  bool help = false;
};

void print_usage(std::ostream& os);

// Throws std::invalid_argument / std::out_of_range on malformed input.
Options parse_args(int argc, char** argv);

}  // namespace pyro::app
