#pragma once
#include "types.hpp"

#include <string>
#include <vector>

namespace trafficgen {

struct Product {
  std::string sku;
  std::string name;
  std::string category;
  double price;
};

struct CountryRanges {
  std::string country;
  double probability;
  std::vector<std::string> cidrs;
};

namespace catalog {

const std::vector<std::string> &user_agents();
// внешние источники перехода (поисковики, соцсети, партнёры)
const std::vector<std::string> &referrers();
const std::vector<std::string> &search_terms();
const std::vector<std::string> &search_categories();
const std::vector<std::string> &outlinks();
// относительные пути или абсолютные URL
const std::vector<std::string> &downloads();
const std::vector<EventDef> &click_events();
const std::vector<EventDef> &random_events();
const std::vector<Product> &products();
const std::vector<CountryRanges> &countries();

} // namespace catalog
} // namespace trafficgen
