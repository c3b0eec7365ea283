#include "pyro/model/color.hpp"

#include <algorithm>
#include <cmath>

namespace pyro::model {

namespace {

std::uint8_t toChannel(double v) {
  return static_cast<std::uint8_t>(std::clamp(std::round(v), 0.0, 255.0));
}

// p/q are the lightness bounds of the hexcone, t the hue offset in [0,1).
double hueToChannel(double p, double q, double t) {
  if (t < 0.0) t += 1.0;
  if (t > 1.0) t -= 1.0;
  if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
  if (t < 0.5) return q;
  if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
  return p;
}

}  // namespace

Rgb Rgb::scaled(double factor) const {
  return Rgb{toChannel(r * factor), toChannel(g * factor), toChannel(b * factor)};
}

Hsl toHsl(const Rgb &c) {
  const double r = c.r / 255.0;
  const double g = c.g / 255.0;
  const double b = c.b / 255.0;

  const double maxC = std::max({r, g, b});
  const double minC = std::min({r, g, b});
  const double delta = maxC - minC;
  const double l = (maxC + minC) / 2.0;

  if (delta == 0.0) return Hsl{0.0, 0.0, l * 100.0};

  const double s = delta / (1.0 - std::abs(2.0 * l - 1.0));

  double h;
  if (maxC == r)
    h = std::fmod((g - b) / delta, 6.0);
  else if (maxC == g)
    h = (b - r) / delta + 2.0;
  else
    h = (r - g) / delta + 4.0;
  h *= 60.0;
  if (h < 0.0) h += 360.0;

  return Hsl{h, std::clamp(s, 0.0, 1.0) * 100.0, l * 100.0};
}

Rgb toRgb(const Hsl &c) {
  const double s = std::clamp(c.s, 0.0, 100.0) / 100.0;
  const double l = std::clamp(c.l, 0.0, 100.0) / 100.0;

  if (s == 0.0) {
    const auto v = toChannel(l * 255.0);
    return Rgb{v, v, v};
  }

  double h = std::fmod(c.h, 360.0);
  if (h < 0.0) h += 360.0;
  h /= 360.0;

  const double q = l < 0.5 ? l * (1.0 + s) : l + s - l * s;
  const double p = 2.0 * l - q;

  return Rgb{toChannel(hueToChannel(p, q, h + 1.0 / 3.0) * 255.0),
             toChannel(hueToChannel(p, q, h) * 255.0),
             toChannel(hueToChannel(p, q, h - 1.0 / 3.0) * 255.0)};
}

}  // namespace pyro::model
