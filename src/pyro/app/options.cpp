#include "pyro/app/options.hpp"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

namespace pyro::app {

void print_usage(std::ostream& os) {
  os << "Usage: pyro [options]\n"
        "Options:\n"
        "  --width <N>               Logical grid width in pixels (default "
     << core::DEFAULT_GRID_WIDTH
     << ")\n"
        "  --height <N>              Logical grid height in pixels (default "
     << core::DEFAULT_GRID_HEIGHT
     << ")\n"
        "  --pixel-size <N>          Screen pixels per logical pixel (default "
     << core::DEFAULT_PIXEL_SIZE
     << ")\n"
        "  --tick-rate <N>           Simulation ticks per second (default "
     << core::DEFAULT_TICK_RATE
     << ")\n"
        "  --fps <N>                 Frame rate limit, 0 => unlimited (default "
     << core::DEFAULT_FRAME_LIMIT
     << ")\n"
        "  --spawn-probability <p>   Launch chance per tick, 0..1 (default 0.1)\n"
        "  --seed <u64>              RNG seed (0 => nondeterministic)\n"
        "  --stats                   Log tick/firework/particle counts once per second\n"
        "  --help                    Show this help\n"
        "\nKeys: Q or Escape quits.\n";
}

namespace {

// Whole-string unsigned decimal, no sign, no whitespace, no trailing characters.
unsigned long long parse_unsigned(const std::string& name, const std::string& value,
                                  unsigned long long minValue, unsigned long long maxValue) {
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front())))
    throw std::invalid_argument(name + " expects an unsigned number, got '" + value + "'");

  std::size_t pos = 0;
  const unsigned long long v = std::stoull(value, &pos);
  if (pos != value.size())
    throw std::invalid_argument(name + " expects an unsigned number, got '" + value + "'");
  if (v > maxValue) throw std::out_of_range(name + " is too large: " + value);
  if (v < minValue) throw std::invalid_argument(name + " must be at least " + std::to_string(minValue));
  return v;
}

unsigned parse_dimension(const std::string& name, const std::string& value) {
  return static_cast<unsigned>(
      parse_unsigned(name, value, 1, std::numeric_limits<unsigned>::max()));
}

int parse_rate(const std::string& name, const std::string& value, int minValue) {
  return static_cast<int>(parse_unsigned(name, value, static_cast<unsigned long long>(minValue),
                                         std::numeric_limits<int>::max()));
}

double parse_probability(const std::string& name, const std::string& value) {
  std::size_t pos = 0;
  const double p = std::stod(value, &pos);
  if (pos != value.size())
    throw std::invalid_argument(name + " expects a number, got '" + value + "'");
  if (!(p >= 0.0 && p <= 1.0)) throw std::invalid_argument(name + " must be within 0..1");
  return p;
}

}  // namespace

Options parse_args(int argc, char** argv) {
  Options o;

  auto require_value = [&](int& i, const std::string& name) -> std::string {
    if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + name);
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--width") {
      o.width = parse_dimension(arg, require_value(i, arg));
    } else if (arg == "--height") {
      o.height = parse_dimension(arg, require_value(i, arg));
    } else if (arg == "--pixel-size") {
      o.pixelSize = parse_dimension(arg, require_value(i, arg));
    } else if (arg == "--tick-rate") {
      o.tickRate = parse_rate(arg, require_value(i, arg), 1);
    } else if (arg == "--fps") {
      o.frameLimit = parse_rate(arg, require_value(i, arg), 0);
    } else if (arg == "--spawn-probability") {
      o.spawnProbability = parse_probability(arg, require_value(i, arg));
    } else if (arg == "--seed") {
      o.seed = parse_unsigned(arg, require_value(i, arg), 0,
                              std::numeric_limits<std::uint64_t>::max());
    } else if (arg == "--stats") {
      o.stats = true;
    } else if (arg == "--help" || arg == "-h") {
      o.help = true;
    } else {
      throw std::invalid_argument("Unknown option: " + arg);
    }
  }

  return o;
}

}  // namespace pyro::app
