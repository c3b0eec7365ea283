#include "pyro/model/core/random.hpp"

namespace pyro::model::random {

namespace {

std::mt19937::result_type deriveSeed(std::uint64_t seed) {
  if (seed == 0) return std::random_device{}();
  SplitMix64 sm(seed);
  return static_cast<std::mt19937::result_type>(sm.next());
}

}  // namespace

MersenneRandom::MersenneRandom(std::uint64_t seed) : m_engine(deriveSeed(seed)) {}

double MersenneRandom::uniform() {
  return m_unit(m_engine);
}

std::uint32_t MersenneRandom::nextU32() {
  return static_cast<std::uint32_t>(m_engine());
}

std::uint8_t MersenneRandom::nextByte() {
  return static_cast<std::uint8_t>(m_byte(m_engine));
}

}  // namespace pyro::model::random
