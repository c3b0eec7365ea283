#pragma once
#include <cstdint>
#include <random>

namespace pyro::model::random {

struct SplitMix64 {
  std::uint64_t x;
  explicit SplitMix64(std::uint64_t seed) : x(seed) {}
  std::uint64_t next() {
    std::uint64_t z = (x += 0x9E3779B97F4A7C15ULL);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
  }
};

// Entropy handed to everything that needs it; never a global.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  virtual double uniform() = 0;  // [0,1)
  virtual std::uint32_t nextU32() = 0;
  virtual std::uint8_t nextByte() = 0;
};

class MersenneRandom final : public RandomSource {
 public:
  // seed 0 => nondeterministic
  explicit MersenneRandom(std::uint64_t seed = 0);

  double uniform() override;
  std::uint32_t nextU32() override;
  std::uint8_t nextByte() override;

 private:
  std::mt19937 m_engine;
  std::uniform_real_distribution<double> m_unit{0.0, 1.0};
  std::uniform_int_distribution<int> m_byte{0, 255};
};

}  // namespace pyro::model::random
