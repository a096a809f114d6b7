#include "trafficgen/random.hpp"

#include <boost/thread/locks.hpp>

namespace trafficgen {

Random::Random() : rng_(std::random_device{}()) {}

Random::Random(std::uint64_t seed) : rng_(seed) {}

void Random::reseed(std::uint64_t seed) {
  boost::lock_guard<boost::mutex> lk(m_);
  rng_.seed(seed);
}

long long Random::uniform_int(long long lo, long long hi) {
  if (hi < lo)
    std::swap(lo, hi);
  boost::lock_guard<boost::mutex> lk(m_);
  return std::uniform_int_distribution<long long>(lo, hi)(rng_);
}

double Random::uniform_real(double lo, double hi) {
  if (hi <= lo)
    return lo;
  boost::lock_guard<boost::mutex> lk(m_);
  return std::uniform_real_distribution<double>(lo, hi)(rng_);
}

bool Random::chance(double p) {
  if (p <= 0.0)
    return false;
  if (p >= 1.0)
    return true;
  return uniform_real(0.0, 1.0) < p;
}

std::string Random::hex(std::size_t n) {
  static const char digits[] = "0123456789abcdef";
  std::string out(n, '0');
  boost::lock_guard<boost::mutex> lk(m_);
  std::uniform_int_distribution<int> d(0, 15);
  for (auto &c : out)
    c = digits[d(rng_)];
  return out;
}

std::size_t Random::weighted_index(const std::vector<double> &weights) {
  if (weights.empty())
    throw std::invalid_argument("Random::weighted_index on empty weights");
  boost::lock_guard<boost::mutex> lk(m_);
  std::discrete_distribution<std::size_t> d(weights.begin(), weights.end());
  return d(rng_);
}

} // namespace trafficgen
