#include "trafficgen/config.hpp"
#include "trafficgen/backfill.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace trafficgen {

namespace {

std::optional<std::string> env(const char *name) {
  const char *v = std::getenv(name);
  if (v == nullptr || *v == '\0')
    return std::nullopt;
  return std::string(v);
}

std::string trim(const std::string &s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

double to_double(const char *name, const std::string &v) {
  try {
    std::size_t pos = 0;
    double d = std::stod(v, &pos);
    if (trim(v.substr(pos)).empty())
      return d;
  } catch (const std::exception &) {
  }
  throw ConfigError(std::string(name) + " must be a number, got '" + v + "'");
}

long long to_int(const char *name, const std::string &v) {
  try {
    std::size_t pos = 0;
    long long n = std::stoll(v, &pos);
    if (trim(v.substr(pos)).empty())
      return n;
  } catch (const std::exception &) {
  }
  throw ConfigError(std::string(name) + " must be an integer, got '" + v +
                    "'");
}

bool to_bool(const char *name, const std::string &v) {
  std::string s = trim(v);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s == "1" || s == "true" || s == "yes" || s == "on")
    return true;
  if (s == "0" || s == "false" || s == "no" || s == "off")
    return false;
  throw ConfigError(std::string(name) + " must be a boolean, got '" + v + "'");
}

std::vector<double> parse_rates(const char *name, const std::string &v) {
  std::vector<double> out;
  std::stringstream ss(v);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = trim(item);
    if (!item.empty())
      out.push_back(to_double(name, item));
  }
  return out;
}

void require_range(const char *name, double v, double lo, double hi) {
  if (v < lo || v > hi) {
    std::ostringstream os;
    os << name << " must be within [" << lo << ", " << hi << "], got " << v;
    throw ConfigError(os.str());
  }
}

void require_order(const char *lo_name, double lo, const char *hi_name,
                   double hi) {
  if (lo > hi)
    throw ConfigError(std::string(lo_name) + " cannot be greater than " +
                      hi_name);
}

std::string strip_trailing_slash(std::string s) {
  while (!s.empty() && s.back() == '/')
    s.pop_back();
  return s;
}

} // namespace

void apply_config_file(Config &c, const std::string &path) {
  std::ifstream f(path);
  if (!f)
    return;
  json j;
  try {
    f >> j;
  } catch (const json::exception &e) {
    throw ConfigError("config file " + path + " is not valid JSON: " +
                      e.what());
  }
  if (!j.is_object())
    throw ConfigError("config file " + path + " must contain a JSON object");

  auto get = [&](const char *key, auto def) {
    using T = std::decay_t<decltype(def)>;
    if (!j.contains(key) || j[key].is_null())
      return def;
    try {
      return j[key].get<T>();
    } catch (const json::exception &e) {
      throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
  };
  auto get_opt = [&](const char *key, auto &field) {
    using T = typename std::decay_t<decltype(field)>::value_type;
    if (j.contains(key) && !j[key].is_null()) {
      try {
        field = j[key].get<T>();
      } catch (const json::exception &e) {
        throw ConfigError(std::string("config key '") + key + "': " +
                          e.what());
      }
    }
  };

  c.matomo_url = get("matomo_url", c.matomo_url);
  c.site_id = get("site_id", c.site_id);
  c.token_auth = get("token_auth", c.token_auth);
  c.urls_file = get("urls_file", c.urls_file);
  c.funnels_file = get("funnels_file", c.funnels_file);

  c.target_visits_per_day =
      get("target_visits_per_day", c.target_visits_per_day);
  c.pageviews_min = get("pageviews_min", c.pageviews_min);
  c.pageviews_max = get("pageviews_max", c.pageviews_max);
  c.concurrency = get("concurrency", c.concurrency);
  c.pause_between_pvs_min =
      get("pause_between_pvs_min", c.pause_between_pvs_min);
  c.pause_between_pvs_max =
      get("pause_between_pvs_max", c.pause_between_pvs_max);

  c.auto_stop_after_hours =
      get("auto_stop_after_hours", c.auto_stop_after_hours);
  c.max_total_visits = get("max_total_visits", c.max_total_visits);
  c.daily_visit_cap = get("daily_visit_cap", c.daily_visit_cap);

  c.sitesearch_probability =
      get("sitesearch_probability", c.sitesearch_probability);
  c.outlinks_probability = get("outlinks_probability", c.outlinks_probability);
  c.downloads_probability =
      get("downloads_probability", c.downloads_probability);
  c.click_events_probability =
      get("click_events_probability", c.click_events_probability);
  c.random_events_probability =
      get("random_events_probability", c.random_events_probability);
  c.direct_traffic_probability =
      get("direct_traffic_probability", c.direct_traffic_probability);
  c.ecommerce_probability =
      get("ecommerce_probability", c.ecommerce_probability);

  c.visit_duration_min = get("visit_duration_min", c.visit_duration_min);
  c.visit_duration_max = get("visit_duration_max", c.visit_duration_max);
  c.randomize_visitor_countries =
      get("randomize_visitor_countries", c.randomize_visitor_countries);

  c.ecommerce_order_value_min =
      get("ecommerce_order_value_min", c.ecommerce_order_value_min);
  c.ecommerce_order_value_max =
      get("ecommerce_order_value_max", c.ecommerce_order_value_max);
  c.ecommerce_items_min = get("ecommerce_items_min", c.ecommerce_items_min);
  c.ecommerce_items_max = get("ecommerce_items_max", c.ecommerce_items_max);
  c.ecommerce_tax_rate = get("ecommerce_tax_rate", c.ecommerce_tax_rate);
  c.ecommerce_shipping_rates =
      get("ecommerce_shipping_rates", c.ecommerce_shipping_rates);
  c.ecommerce_currency = get("ecommerce_currency", c.ecommerce_currency);

  c.timezone = get("timezone", c.timezone);
  c.request_timeout_seconds =
      get("request_timeout_seconds", c.request_timeout_seconds);

  c.backfill_enabled = get("backfill_enabled", c.backfill_enabled);
  c.backfill_run_once = get("backfill_run_once", c.backfill_run_once);
  get_opt("backfill_start_date", c.backfill_start_date);
  get_opt("backfill_end_date", c.backfill_end_date);
  get_opt("backfill_days_back", c.backfill_days_back);
  get_opt("backfill_duration_days", c.backfill_duration_days);
  c.backfill_max_visits_per_day =
      get("backfill_max_visits_per_day", c.backfill_max_visits_per_day);
  c.backfill_max_visits_total =
      get("backfill_max_visits_total", c.backfill_max_visits_total);
  get_opt("backfill_rps_limit", c.backfill_rps_limit);
  get_opt("backfill_seed", c.backfill_seed);

  // допускаем и вложенный объект, и строку с JSON
  if (j.contains("multi_target_config")) {
    const auto &mt = j["multi_target_config"];
    if (mt.is_string())
      c.multi_target_config = mt.get<std::string>();
    else if (!mt.is_null())
      c.multi_target_config = mt.dump();
  }

  c.auto_start = get("auto_start", c.auto_start);
  c.start_signal_file = get("start_signal_file", c.start_signal_file);
  c.start_check_interval =
      get("start_check_interval", c.start_check_interval);

  c.control_host = get("control_host", c.control_host);
  c.control_port = static_cast<unsigned short>(
      get("control_port", static_cast<int>(c.control_port)));

  c.redis_enabled = get("redis_enabled", c.redis_enabled);
  c.redis_host = get("redis_host", c.redis_host);
  c.redis_port = get("redis_port", c.redis_port);

  c.log_level = get("log_level", c.log_level);
}

void apply_env(Config &c) {
  auto str = [](const char *name, std::string &field) {
    if (auto v = env(name))
      field = *v;
  };
  auto dbl = [](const char *name, double &field) {
    if (auto v = env(name))
      field = to_double(name, *v);
  };
  auto integer = [](const char *name, auto &field) {
    using T = std::decay_t<decltype(field)>;
    if (auto v = env(name)) {
      long long n = to_int(name, *v);
      if (std::is_unsigned<T>::value && n < 0)
        throw ConfigError(std::string(name) + " must not be negative");
      field = static_cast<T>(n);
    }
  };
  auto boolean = [](const char *name, bool &field) {
    if (auto v = env(name))
      field = to_bool(name, *v);
  };

  str("MATOMO_URL", c.matomo_url);
  integer("MATOMO_SITE_ID", c.site_id);
  str("MATOMO_TOKEN_AUTH", c.token_auth);
  str("URLS_FILE", c.urls_file);
  str("FUNNEL_CONFIG_PATH", c.funnels_file);

  dbl("TARGET_VISITS_PER_DAY", c.target_visits_per_day);
  integer("PAGEVIEWS_MIN", c.pageviews_min);
  integer("PAGEVIEWS_MAX", c.pageviews_max);
  integer("CONCURRENCY", c.concurrency);
  dbl("PAUSE_BETWEEN_PVS_MIN", c.pause_between_pvs_min);
  dbl("PAUSE_BETWEEN_PVS_MAX", c.pause_between_pvs_max);

  dbl("AUTO_STOP_AFTER_HOURS", c.auto_stop_after_hours);
  integer("MAX_TOTAL_VISITS", c.max_total_visits);
  integer("DAILY_VISIT_CAP", c.daily_visit_cap);

  dbl("SITESEARCH_PROBABILITY", c.sitesearch_probability);
  dbl("OUTLINKS_PROBABILITY", c.outlinks_probability);
  dbl("DOWNLOADS_PROBABILITY", c.downloads_probability);
  dbl("CLICK_EVENTS_PROBABILITY", c.click_events_probability);
  dbl("RANDOM_EVENTS_PROBABILITY", c.random_events_probability);
  dbl("DIRECT_TRAFFIC_PROBABILITY", c.direct_traffic_probability);
  dbl("ECOMMERCE_PROBABILITY", c.ecommerce_probability);

  dbl("VISIT_DURATION_MIN", c.visit_duration_min);
  dbl("VISIT_DURATION_MAX", c.visit_duration_max);
  boolean("RANDOMIZE_VISITOR_COUNTRIES", c.randomize_visitor_countries);

  dbl("ECOMMERCE_ORDER_VALUE_MIN", c.ecommerce_order_value_min);
  dbl("ECOMMERCE_ORDER_VALUE_MAX", c.ecommerce_order_value_max);
  integer("ECOMMERCE_ITEMS_MIN", c.ecommerce_items_min);
  integer("ECOMMERCE_ITEMS_MAX", c.ecommerce_items_max);
  dbl("ECOMMERCE_TAX_RATE", c.ecommerce_tax_rate);
  if (auto v = env("ECOMMERCE_SHIPPING_RATES"))
    c.ecommerce_shipping_rates = parse_rates("ECOMMERCE_SHIPPING_RATES", *v);
  str("ECOMMERCE_CURRENCY", c.ecommerce_currency);

  str("TIMEZONE", c.timezone);
  dbl("REQUEST_TIMEOUT_SECONDS", c.request_timeout_seconds);

  boolean("BACKFILL_ENABLED", c.backfill_enabled);
  boolean("BACKFILL_RUN_ONCE", c.backfill_run_once);
  if (auto v = env("BACKFILL_START_DATE"))
    c.backfill_start_date = trim(*v);
  if (auto v = env("BACKFILL_END_DATE"))
    c.backfill_end_date = trim(*v);
  if (auto v = env("BACKFILL_DAYS_BACK"))
    c.backfill_days_back =
        static_cast<int>(to_int("BACKFILL_DAYS_BACK", *v));
  if (auto v = env("BACKFILL_DURATION_DAYS"))
    c.backfill_duration_days =
        static_cast<int>(to_int("BACKFILL_DURATION_DAYS", *v));
  integer("BACKFILL_MAX_VISITS_PER_DAY", c.backfill_max_visits_per_day);
  integer("BACKFILL_MAX_VISITS_TOTAL", c.backfill_max_visits_total);
  if (auto v = env("BACKFILL_RPS_LIMIT"))
    c.backfill_rps_limit = to_double("BACKFILL_RPS_LIMIT", *v);
  if (auto v = env("BACKFILL_SEED")) {
    long long s = to_int("BACKFILL_SEED", *v);
    if (s < 0 || s > 2147483647LL)
      throw ConfigError("BACKFILL_SEED must be within [0, 2147483647]");
    c.backfill_seed = static_cast<std::uint32_t>(s);
  }

  str("MULTI_TARGET_CONFIG", c.multi_target_config);

  boolean("AUTO_START", c.auto_start);
  str("START_SIGNAL_FILE", c.start_signal_file);
  dbl("START_CHECK_INTERVAL", c.start_check_interval);

  str("CONTROL_HOST", c.control_host);
  if (auto v = env("CONTROL_PORT")) {
    long long p = to_int("CONTROL_PORT", *v);
    if (p < 0 || p > 65535)
      throw ConfigError("CONTROL_PORT is out of range (0..65535)");
    c.control_port = static_cast<unsigned short>(p);
  }

  boolean("REDIS_ENABLED", c.redis_enabled);
  str("REDIS_HOST", c.redis_host);
  integer("REDIS_PORT", c.redis_port);

  str("LOG_LEVEL", c.log_level);
}

void validate(const Config &c) {
  const auto scheme_end = c.matomo_url.find("://");
  if (scheme_end == std::string::npos)
    throw ConfigError("MATOMO_URL must include scheme (http:// or https://)");
  const std::string scheme = c.matomo_url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https")
    throw ConfigError("MATOMO_URL must use http:// or https://");
  if (c.matomo_url.size() <= scheme_end + 3 ||
      c.matomo_url[scheme_end + 3] == '/')
    throw ConfigError("MATOMO_URL must include a valid host");

  if (c.site_id < 1)
    throw ConfigError("MATOMO_SITE_ID must be >= 1");

  require_range("TARGET_VISITS_PER_DAY", c.target_visits_per_day, 1,
                1000000);
  require_range("PAGEVIEWS_MIN", c.pageviews_min, 1, 100);
  require_range("PAGEVIEWS_MAX", c.pageviews_max, 1, 100);
  require_order("pageviews_min", c.pageviews_min, "pageviews_max",
                c.pageviews_max);
  require_range("CONCURRENCY", static_cast<double>(c.concurrency), 1, 500);
  require_range("PAUSE_BETWEEN_PVS_MIN", c.pause_between_pvs_min, 0, 60);
  require_range("PAUSE_BETWEEN_PVS_MAX", c.pause_between_pvs_max, 0, 60);
  require_order("pause_between_pvs_min", c.pause_between_pvs_min,
                "pause_between_pvs_max", c.pause_between_pvs_max);
  require_range("AUTO_STOP_AFTER_HOURS", c.auto_stop_after_hours, 0, 168);

  require_range("SITESEARCH_PROBABILITY", c.sitesearch_probability, 0, 1);
  require_range("OUTLINKS_PROBABILITY", c.outlinks_probability, 0, 1);
  require_range("DOWNLOADS_PROBABILITY", c.downloads_probability, 0, 1);
  require_range("CLICK_EVENTS_PROBABILITY", c.click_events_probability, 0, 1);
  require_range("RANDOM_EVENTS_PROBABILITY", c.random_events_probability, 0,
                1);
  require_range("DIRECT_TRAFFIC_PROBABILITY", c.direct_traffic_probability, 0,
                1);
  require_range("ECOMMERCE_PROBABILITY", c.ecommerce_probability, 0, 1);

  require_range("VISIT_DURATION_MIN", c.visit_duration_min, 0.1, 120);
  require_range("VISIT_DURATION_MAX", c.visit_duration_max, 0.1, 120);
  require_order("visit_duration_min", c.visit_duration_min,
                "visit_duration_max", c.visit_duration_max);

  require_range("ECOMMERCE_ORDER_VALUE_MIN", c.ecommerce_order_value_min,
                0.01, 1e9);
  require_range("ECOMMERCE_ORDER_VALUE_MAX", c.ecommerce_order_value_max,
                0.01, 1e9);
  require_order("ecommerce_order_value_min", c.ecommerce_order_value_min,
                "ecommerce_order_value_max", c.ecommerce_order_value_max);
  if (std::llround(c.ecommerce_order_value_max * 100.0) -
          std::llround(c.ecommerce_order_value_min * 100.0) <
      1)
    throw ConfigError("ecommerce_order_value_max must exceed "
                      "ecommerce_order_value_min by at least 0.01");
  require_range("ECOMMERCE_ITEMS_MIN", c.ecommerce_items_min, 1, 100);
  require_range("ECOMMERCE_ITEMS_MAX", c.ecommerce_items_max, 1, 100);
  require_order("ecommerce_items_min", c.ecommerce_items_min,
                "ecommerce_items_max", c.ecommerce_items_max);
  require_range("ECOMMERCE_TAX_RATE", c.ecommerce_tax_rate, 0, 1);
  for (double r : c.ecommerce_shipping_rates)
    require_range("ECOMMERCE_SHIPPING_RATES", r, 0, 1e6);
  if (c.ecommerce_currency.size() != 3 ||
      !std::all_of(c.ecommerce_currency.begin(), c.ecommerce_currency.end(),
                   [](unsigned char ch) { return std::isupper(ch); }))
    throw ConfigError("ECOMMERCE_CURRENCY must be 3 uppercase letters");

  if (c.request_timeout_seconds <= 0)
    throw ConfigError("REQUEST_TIMEOUT_SECONDS must be positive");
  if (c.start_check_interval <= 0)
    throw ConfigError("START_CHECK_INTERVAL must be positive");

  if (c.backfill_enabled) {
    if (c.backfill_days_back)
      require_range("BACKFILL_DAYS_BACK", *c.backfill_days_back, 1, 365);
    if (c.backfill_duration_days)
      require_range("BACKFILL_DURATION_DAYS", *c.backfill_duration_days, 1,
                    365);
    require_range("BACKFILL_MAX_VISITS_PER_DAY",
                  static_cast<double>(c.backfill_max_visits_per_day), 1,
                  10000);
    if (c.backfill_max_visits_total > 0 &&
        c.backfill_max_visits_total < c.backfill_max_visits_per_day)
      throw ConfigError(
          "BACKFILL_MAX_VISITS_TOTAL must be >= BACKFILL_MAX_VISITS_PER_DAY");
    if (c.backfill_rps_limit &&
        (*c.backfill_rps_limit <= 0 || *c.backfill_rps_limit > 500))
      throw ConfigError("BACKFILL_RPS_LIMIT must be within (0, 500]");
    // окно проверяется там же, где вычисляется
    (void)compute_backfill_window(c);
  }
}

Config load_config(const std::string &path) {
  Config c;
  if (!path.empty())
    apply_config_file(c, path);
  apply_env(c);
  c.matomo_url = strip_trailing_slash(c.matomo_url);
  validate(c);
  return c;
}

} // namespace trafficgen
