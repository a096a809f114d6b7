#include "trafficgen/url_list.hpp"
#include "trafficgen/config.hpp"

#include <fstream>

namespace trafficgen {

namespace {

std::string trim(const std::string &s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

} // namespace

UrlList parse_urls(std::istream &in) {
  UrlList out;
  std::string line;
  while (std::getline(in, line)) {
    const std::string s = trim(line);
    if (s.empty() || s[0] == '#')
      continue;
    UrlEntry e;
    const auto tab = s.find('\t');
    const std::string head = tab == std::string::npos ? s : s.substr(0, tab);
    e.url = head.substr(0, head.find_first_of(" \t"));
    if (tab != std::string::npos)
      e.title = trim(s.substr(tab + 1));
    out.push_back(std::move(e));
  }
  return out;
}

UrlList read_urls(const std::string &path) {
  std::ifstream f(path);
  if (!f)
    throw ConfigError("cannot open URLS_FILE " + path);
  UrlList urls = parse_urls(f);
  if (urls.empty())
    throw ConfigError("No URLs found in URLS_FILE " + path);
  return urls;
}

std::string action_name_for(const UrlEntry &entry) {
  if (!entry.title.empty())
    return entry.title;
  const auto scheme = entry.url.find("://");
  const auto slash =
      entry.url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
  if (slash == std::string::npos)
    return "Home";
  std::string path = entry.url.substr(slash);
  path = path.substr(0, path.find_first_of("?#"));
  if (path.empty() || path == "/")
    return "Home";
  return path;
}

} // namespace trafficgen
