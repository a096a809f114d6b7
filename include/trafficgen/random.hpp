#pragma once
#include <boost/thread/mutex.hpp>

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace trafficgen {

// Общий генератор для всех воркеров. reseed() даёт воспроизводимость
// backfill по дням.
class Random {
public:
  Random();
  explicit Random(std::uint64_t seed);

  void reseed(std::uint64_t seed);

  // [lo, hi] включительно
  long long uniform_int(long long lo, long long hi);
  // [lo, hi)
  double uniform_real(double lo, double hi);
  // true с вероятностью p
  bool chance(double p);
  // строчные hex-символы
  std::string hex(std::size_t n);

  template <class T>
  const T &pick(const std::vector<T> &items) {
    if (items.empty())
      throw std::invalid_argument("Random::pick on empty list");
    return items[static_cast<std::size_t>(
        uniform_int(0, static_cast<long long>(items.size()) - 1))];
  }

  // индекс с вероятностью, пропорциональной весу
  std::size_t weighted_index(const std::vector<double> &weights);

private:
  boost::mutex m_;
  std::mt19937_64 rng_;
};

} // namespace trafficgen
