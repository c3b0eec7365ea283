#pragma once

#include <cstdint>

namespace pyro::model {

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  // Each channel multiplied by factor, rounded to nearest and clamped to [0,255].
  [[nodiscard]] Rgb scaled(double factor) const;

  friend constexpr bool operator==(const Rgb &, const Rgb &) = default;
};

/**
 * Hue in degrees [0,360), saturation and lightness in [0,100].
 * Values stay unrounded so RGB -> HSL -> RGB is lossless up to rounding.
 */
struct Hsl {
  double h = 0.0;
  double s = 0.0;
  double l = 0.0;
};

inline constexpr Rgb WHITE{255, 255, 255};
inline constexpr Rgb BLACK{0, 0, 0};

[[nodiscard]] Hsl toHsl(const Rgb &c);
[[nodiscard]] Rgb toRgb(const Hsl &c);

}  // namespace pyro::model
