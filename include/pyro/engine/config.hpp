#pragma once
#include <cstddef>

namespace pyro::engine {
struct SimulationConfig {
  double spawnProbability = 0.10;  // one trial per tick
  std::size_t burstSize = 25;      // effect particles per detonation
  double detonationSpeed = -0.3;   // rocket bursts once vy rises above this
  double gravity = 0.02;           // +y is down

  // launch speed = minLaunchSpeed - U * launchSpeedRange
  double minLaunchSpeed = -1.0;
  double launchSpeedRange = 1.0;

  double saturationJitter = 20.0;  // +/- around the seed saturation
  double lightnessJitter = 40.0;   // +/- around the seed lightness

  // burst velocity = spread * (U - bias)
  double burstSpreadX = 1.5;
  double burstBiasX = 0.5;
  double burstSpreadY = 1.5;
  double burstBiasY = 0.9;  // mostly upward

  double effectFading = 0.01;  // lifetime lost per tick
};
}  // namespace pyro::engine
