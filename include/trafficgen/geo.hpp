#pragma once
#include "random.hpp"
#include "types.hpp"

#include <cstdint>
#include <string>

namespace trafficgen {

struct Ipv4Range {
  std::uint32_t network;
  std::uint32_t hosts; // число адресов в сети
};

// "a.b.c.d/n"; бросает std::invalid_argument
Ipv4Range parse_cidr(const std::string &cidr);

std::string ipv4_to_string(std::uint32_t addr);

// адрес внутри сети, без адреса сети и широковещательного
std::string random_host(const Ipv4Range &r, Random &rng);

// Кумулятивный выбор страны по вероятностям, затем случайный адрес в одном из
// её диапазонов. Если вероятности не покрыли бросок, берём United States.
GeoChoice choose_country_and_ip(Random &rng);

} // namespace trafficgen
