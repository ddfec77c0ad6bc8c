#include "core/random/RandomSource.h"

#include <stdexcept>

MersenneRandomSource::MersenneRandomSource() : engine_(std::random_device{}()) {}

MersenneRandomSource::MersenneRandomSource(unsigned int seed) : engine_(seed) {}

double MersenneRandomSource::uniformReal(double lo, double hi) {
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(engine_);
}

std::size_t MersenneRandomSource::uniformIndex(std::size_t count) {
  if (count == 0) {
    throw std::invalid_argument("uniformIndex requires a non-empty range");
  }
  std::uniform_int_distribution<std::size_t> dist(0, count - 1);
  return dist(engine_);
}
