#include "trafficgen/geo.hpp"
#include "trafficgen/catalog.hpp"

#include <cstdio>
#include <stdexcept>

namespace trafficgen {

Ipv4Range parse_cidr(const std::string &cidr) {
  unsigned a = 0, b = 0, c = 0, d = 0, bits = 0;
  char tail = 0;
  if (std::sscanf(cidr.c_str(), "%u.%u.%u.%u/%u%c", &a, &b, &c, &d, &bits,
                  &tail) != 5 ||
      a > 255 || b > 255 || c > 255 || d > 255 || bits > 32)
    throw std::invalid_argument("bad CIDR '" + cidr + "'");
  const std::uint32_t addr = (a << 24) | (b << 16) | (c << 8) | d;
  const std::uint64_t size = 1ULL << (32 - bits);
  const std::uint32_t mask =
      bits == 0 ? 0u : static_cast<std::uint32_t>(~0u << (32 - bits));
  return Ipv4Range{addr & mask, static_cast<std::uint32_t>(
                                    size > 0xFFFFFFFFULL ? 0xFFFFFFFFULL : size)};
}

std::string ipv4_to_string(std::uint32_t addr) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u", (addr >> 24) & 0xFF,
                (addr >> 16) & 0xFF, (addr >> 8) & 0xFF, addr & 0xFF);
  return buf;
}

std::string random_host(const Ipv4Range &r, Random &rng) {
  if (r.hosts <= 2)
    return ipv4_to_string(r.network);
  const auto offset = rng.uniform_int(1, static_cast<long long>(r.hosts) - 2);
  return ipv4_to_string(r.network + static_cast<std::uint32_t>(offset));
}

GeoChoice choose_country_and_ip(Random &rng) {
  const auto &countries = catalog::countries();
  const double roll = rng.uniform_real(0.0, 1.0);
  double acc = 0.0;
  const CountryRanges *chosen = nullptr;
  for (const auto &c : countries) {
    acc += c.probability;
    if (roll < acc) {
      chosen = &c;
      break;
    }
  }
  if (chosen == nullptr)
    chosen = &countries.front();

  const auto range = parse_cidr(rng.pick(chosen->cidrs));
  return GeoChoice{chosen->country, random_host(range, rng)};
}

} // namespace trafficgen
