#include "trafficgen/funnel.hpp"
#include "trafficgen/catalog.hpp"
#include "trafficgen/log.hpp"
#include "trafficgen/time_utils.hpp"
#include "trafficgen/url_list.hpp"
#include "trafficgen/visit_composer.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <boost/thread/locks.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace trafficgen {

namespace {

std::optional<double> opt_double(const json &j, const char *key) {
  if (!j.contains(key) || j.at(key).is_null())
    return std::nullopt;
  const auto &v = j.at(key);
  if (v.is_string())
    return std::stod(v.get<std::string>());
  return v.get<double>();
}

std::string opt_string(const json &j, const char *key) {
  if (!j.contains(key) || j.at(key).is_null())
    return {};
  return j.at(key).get<std::string>();
}

FunnelStep parse_step(const json &j) {
  if (!j.is_object())
    throw std::invalid_argument("step is not an object");
  FunnelStep s;
  s.type = parse_step_type(j.at("type").get<std::string>());
  s.url = opt_string(j, "url");
  s.action_name = opt_string(j, "action_name");

  const auto dmin = opt_double(j, "delay_seconds_min");
  const auto dmax = opt_double(j, "delay_seconds_max");
  s.delay_min = dmin.value_or(1.0);
  s.delay_max = dmax ? *dmax : std::max(s.delay_min, 2.0);
  if (s.delay_min < 0 || s.delay_max < s.delay_min)
    throw std::invalid_argument("delay window must satisfy max >= min >= 0");

  switch (s.type) {
  case StepType::Pageview:
    break;
  case StepType::Event:
    s.event.category = opt_string(j, "event_category");
    s.event.action = opt_string(j, "event_action");
    s.event.name = opt_string(j, "event_name");
    s.event.value = opt_double(j, "event_value");
    if (s.event.category.empty() || s.event.action.empty())
      throw std::invalid_argument("event step needs event_category and "
                                  "event_action");
    // e_n обязателен: без event_name берём action_name, затем event_action
    if (s.event.name.empty())
      s.event.name = s.action_name.empty() ? s.event.action : s.action_name;
    break;
  case StepType::SiteSearch:
    s.search_keyword = opt_string(j, "search_keyword");
    s.search_category = opt_string(j, "search_category");
    if (const auto n = opt_double(j, "search_results"))
      s.search_results = static_cast<int>(*n);
    break;
  case StepType::Outlink:
  case StepType::Download:
    s.target_url = opt_string(j, "target_url");
    if (s.target_url.empty())
      throw std::invalid_argument(std::string(to_string(s.type)) +
                                  " step needs target_url");
    break;
  case StepType::Ecommerce:
    s.ecommerce.revenue = opt_double(j, "ecommerce_revenue");
    s.ecommerce.subtotal = opt_double(j, "ecommerce_subtotal");
    s.ecommerce.tax = opt_double(j, "ecommerce_tax");
    s.ecommerce.shipping = opt_double(j, "ecommerce_shipping");
    if (j.contains("ecommerce_currency") && j["ecommerce_currency"].is_string())
      s.ecommerce.currency = j["ecommerce_currency"].get<std::string>();
    break;
  }
  return s;
}

} // namespace

const char *to_string(StepType t) {
  switch (t) {
  case StepType::Event:
    return "event";
  case StepType::SiteSearch:
    return "site_search";
  case StepType::Outlink:
    return "outlink";
  case StepType::Download:
    return "download";
  case StepType::Ecommerce:
    return "ecommerce";
  case StepType::Pageview:
    break;
  }
  return "pageview";
}

StepType parse_step_type(const std::string &s) {
  if (s == "pageview")
    return StepType::Pageview;
  if (s == "event")
    return StepType::Event;
  if (s == "site_search" || s == "search")
    return StepType::SiteSearch;
  if (s == "outlink")
    return StepType::Outlink;
  if (s == "download")
    return StepType::Download;
  if (s == "ecommerce")
    return StepType::Ecommerce;
  throw std::invalid_argument("unknown step type '" + s + "'");
}

Funnel parse_funnel(const json &j) {
  if (!j.is_object())
    throw std::invalid_argument("funnel is not an object");
  Funnel f;
  f.name = opt_string(j, "name");
  if (f.name.empty())
    throw std::invalid_argument("funnel has no name");
  f.description = opt_string(j, "description");
  f.probability = opt_double(j, "probability").value_or(0.0);
  if (f.probability < 0.0 || f.probability > 1.0)
    throw std::invalid_argument("probability must be within [0, 1]");
  f.priority = j.value("priority", 0);
  f.enabled = j.value("enabled", true);
  f.exit_after_completion = j.value("exit_after_completion", true);

  if (!j.contains("steps") || !j.at("steps").is_array() ||
      j.at("steps").empty())
    throw std::invalid_argument("steps must be a non-empty list");
  for (const auto &st : j.at("steps"))
    f.steps.push_back(parse_step(st));
  if (f.steps.front().type != StepType::Pageview)
    throw std::invalid_argument("first step must be a pageview");
  return f;
}

std::vector<Funnel> parse_funnels(const json &arr) {
  std::vector<Funnel> out;
  if (!arr.is_array()) {
    log_warn("FUNNEL", "definitions are not a JSON array, nothing loaded");
    return out;
  }
  for (const auto &j : arr) {
    std::string name = "?";
    try {
      if (j.is_object() && j.contains("name") && j["name"].is_string())
        name = j["name"].get<std::string>();
      if (j.is_object() && !j.value("enabled", true))
        continue;
      out.push_back(parse_funnel(j));
    } catch (const std::exception &e) {
      log_warn("FUNNEL", "skipping '" + name + "': " + e.what());
    }
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const Funnel &a, const Funnel &b) {
                     return a.priority < b.priority;
                   });
  return out;
}

std::vector<Funnel> load_funnels_from_file(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    log_warn("FUNNEL", "cannot open " + path + ", no funnels loaded");
    return {};
  }
  try {
    json arr;
    f >> arr;
    return parse_funnels(arr);
  } catch (const json::exception &e) {
    log_warn("FUNNEL", "bad JSON in " + path + ": " + e.what());
    return {};
  }
}

// --- FunnelRegistry --------------------------------------------------------

FunnelRegistry::FunnelRegistry(std::string path) : path_(std::move(path)) {}

std::size_t FunnelRegistry::reload() {
  if (path_.empty())
    return size();
  auto fresh = load_funnels_from_file(path_);
  const std::size_t n = fresh.size();
  {
    boost::lock_guard<boost::mutex> lk(m_);
    funnels_ = std::move(fresh);
  }
  log_info("FUNNEL", "loaded " + std::to_string(n) + " funnel(s) from " + path_);
  return n;
}

void FunnelRegistry::set(std::vector<Funnel> funnels) {
  std::stable_sort(funnels.begin(), funnels.end(),
                   [](const Funnel &a, const Funnel &b) {
                     return a.priority < b.priority;
                   });
  boost::lock_guard<boost::mutex> lk(m_);
  funnels_ = std::move(funnels);
}

std::vector<Funnel> FunnelRegistry::snapshot() const {
  boost::lock_guard<boost::mutex> lk(m_);
  return funnels_;
}

std::size_t FunnelRegistry::size() const {
  boost::lock_guard<boost::mutex> lk(m_);
  return funnels_.size();
}

// --- FunnelEngine ----------------------------------------------------------

FunnelEngine::FunnelEngine(VisitComposer &composer, FunnelRegistry &registry)
    : composer_(composer), registry_(registry) {}

std::optional<Funnel> FunnelEngine::select_funnel() {
  for (auto &f : registry_.snapshot()) {
    if (composer_.rng().chance(f.probability))
      return std::move(f);
  }
  return std::nullopt;
}

bool FunnelEngine::execute(const Funnel &funnel, const UrlList &urls,
                           const std::optional<TimeWindow> &window,
                           VisitContext &ctx) {
  Random &rng = composer_.rng();
  const Config &cfg = composer_.config();
  const std::size_t n = funnel.steps.size();

  // задержка после шага i сдвигает шаг i + 1; после последнего не нужна
  std::vector<milliseconds> delays(n, milliseconds(0));
  milliseconds total{0};
  for (std::size_t i = 0; i + 1 < n; ++i) {
    const auto &st = funnel.steps[i];
    delays[i] = seconds_to_ms(rng.uniform_real(st.delay_min, st.delay_max));
    total += delays[i];
  }
  // на каждый шаг запас в секунду: cdt с точностью до секунды
  const milliseconds reserve = seconds(static_cast<long long>(n));

  TimePoint base;
  if (window) {
    const auto span = std::chrono::duration_cast<milliseconds>(
        window->end - window->begin) - reserve;
    if (total > span && total.count() > 0) {
      const double k = span.count() > 0
                           ? static_cast<double>(span.count()) / total.count()
                           : 0.0;
      total = milliseconds(0);
      for (auto &d : delays) {
        d = milliseconds(static_cast<long long>(d.count() * k));
        total += d;
      }
    }
    const auto slack = std::max<long long>(0, (span - total).count());
    base = window->begin + milliseconds(rng.uniform_int(0, slack));
  } else {
    base = std::chrono::time_point_cast<Clock::duration>(Clock::now() - total -
                                                         reserve);
  }

  const bool pacing = composer_.pacing_enabled() && !window;
  TimePoint planned = base;

  for (std::size_t i = 0; i < n; ++i) {
    const FunnelStep &st = funnel.steps[i];
    const TimePoint ts = next_hit_time(ctx, planned);

    std::string page = st.url.empty() ? ctx.last_page_url : st.url;
    if (page.empty())
      page = rng.pick(urls).url;

    HitParams p;
    switch (st.type) {
    case StepType::Pageview: {
      const std::string name = st.action_name.empty()
                                   ? action_name_for(UrlEntry{page, {}})
                                   : st.action_name;
      p = make_base_params(ctx, page, ts, rng, name);
      p.emplace_back("pv_id", rng.hex(6));
      break;
    }
    case StepType::Event:
      p = make_base_params(ctx, page, ts, rng, st.action_name);
      p.emplace_back("e_c", st.event.category);
      p.emplace_back("e_a", st.event.action);
      p.emplace_back("e_n", st.event.name);
      if (st.event.value)
        p.emplace_back("e_v", format_amount(*st.event.value));
      break;
    case StepType::SiteSearch: {
      const std::string kw = st.search_keyword.empty()
                                 ? rng.pick(catalog::search_terms())
                                 : st.search_keyword;
      p = make_base_params(ctx, page, ts, rng,
                           st.action_name.empty() ? "Search: " + kw
                                                  : st.action_name);
      p.emplace_back("pv_id", rng.hex(6));
      p.emplace_back("search", kw);
      if (!st.search_category.empty())
        p.emplace_back("search_cat", st.search_category);
      p.emplace_back("search_count",
                     std::to_string(st.search_results
                                        ? *st.search_results
                                        : rng.uniform_int(0, 25)));
      break;
    }
    case StepType::Outlink:
      p = make_base_params(ctx, st.target_url, ts, rng, {}, page);
      p.emplace_back("link", st.target_url);
      log_info("FUNNEL", funnel.name + ": outlink " + st.target_url);
      break;
    case StepType::Download: {
      const std::string file = resolve_download_url(page, st.target_url);
      p = make_base_params(ctx, file, ts, rng, {}, page);
      p.emplace_back("download", file);
      log_info("FUNNEL", funnel.name + ": download " + file);
      break;
    }
    case StepType::Ecommerce: {
      auto order = generate_ecommerce_order(cfg, rng, true);
      apply_overrides(*order, st.ecommerce);
      p = make_base_params(ctx, page, ts, rng);
      append_ecommerce_params(p, *order);
      break;
    }
    }

    composer_.send(ctx, std::move(p));
    // для outlink/download последней остаётся страница со ссылкой
    ctx.last_page_url = page;

    if (i + 1 < n) {
      planned += delays[i];
      if (pacing) {
        composer_.pause(delays[i]);
        if (!composer_.still_running())
          return true;
      }
    }
  }
  log_dbg("FUNNEL", "completed '" + funnel.name + "' visitor=" + ctx.visitor_id);
  return funnel.exit_after_completion;
}

} // namespace trafficgen
