#pragma once
#include "types.hpp"

#include <istream>
#include <string>

namespace trafficgen {

// По URL на строку, необязательный заголовок через TAB, '#' начинает комментарий.
// Пустой результат или нечитаемый файл -> ConfigError.
UrlList read_urls(const std::string &path);
UrlList parse_urls(std::istream &in);

// action_name: заголовок, если есть, иначе путь из URL ("/" -> "Home")
std::string action_name_for(const UrlEntry &entry);

} // namespace trafficgen
