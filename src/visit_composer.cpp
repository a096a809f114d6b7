#include "trafficgen/visit_composer.hpp"
#include "trafficgen/catalog.hpp"
#include "trafficgen/geo.hpp"
#include "trafficgen/log.hpp"
#include "trafficgen/time_utils.hpp"
#include "trafficgen/url_list.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace trafficgen {

using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

std::string format_event_value(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", v);
  return buf;
}

void append_event_params(HitParams &p, const EventDef &ev) {
  p.emplace_back("e_c", ev.category);
  p.emplace_back("e_a", ev.action);
  p.emplace_back("e_n", ev.name);
  if (ev.value)
    p.emplace_back("e_v", format_event_value(*ev.value));
}

// отрезаем действия, не поместившиеся в урезанный визит
void drop_beyond(ActionPages &a, int n) {
  for (int *idx : {&a.search, &a.outlink, &a.download, &a.click_event,
                   &a.random_event})
    if (*idx > n)
      *idx = -1;
}

} // namespace

ActionPages choose_action_pages(int num_pvs, bool want_search,
                                bool want_outlink, bool want_download,
                                bool want_click, bool want_random,
                                Random &rng) {
  ActionPages a;
  if (num_pvs <= 1)
    return a;
  auto pick = [&](bool want) {
    return want ? static_cast<int>(rng.uniform_int(2, num_pvs)) : -1;
  };
  a.search = pick(want_search);
  a.outlink = pick(want_outlink);
  a.download = pick(want_download);
  a.click_event = pick(want_click);
  a.random_event = pick(want_random);
  return a;
}

PageAction action_at(const ActionPages &pages, int index) {
  if (index == pages.search)
    return PageAction::Search;
  if (index == pages.outlink)
    return PageAction::Outlink;
  if (index == pages.download)
    return PageAction::Download;
  if (index == pages.click_event)
    return PageAction::ClickEvent;
  if (index == pages.random_event)
    return PageAction::RandomEvent;
  return PageAction::Pageview;
}

std::string resolve_download_url(const std::string &page_url,
                                 const std::string &file) {
  if (file.rfind("http://", 0) == 0 || file.rfind("https://", 0) == 0)
    return file;
  const auto scheme = page_url.find("://");
  std::string base = page_url;
  if (scheme != std::string::npos) {
    const auto slash = page_url.find('/', scheme + 3);
    base = page_url.substr(0, slash);
  }
  if (file.empty() || file[0] != '/')
    return base + "/" + file;
  return base + file;
}

HitParams make_base_params(const VisitContext &ctx, const std::string &url,
                           TimePoint ts, Random &rng,
                           const std::string &action_name,
                           const std::optional<std::string> &referrer_override) {
  HitParams p;
  p.reserve(12);
  p.emplace_back("rec", "1");
  p.emplace_back("_id", ctx.visitor_id);
  p.emplace_back("rand", std::to_string(rng.uniform_int(0, 2147483647LL)));
  p.emplace_back("cdt", format_cdt(ts));
  p.emplace_back("url", url);
  if (!action_name.empty())
    p.emplace_back("action_name", action_name);

  if (ctx.hits_sent == 0) {
    p.emplace_back("new_visit", "1");
    if (referrer_override)
      p.emplace_back("urlref", *referrer_override);
    else if (ctx.referrer)
      p.emplace_back("urlref", *ctx.referrer);
  } else if (referrer_override) {
    p.emplace_back("urlref", *referrer_override);
  } else if (!ctx.last_page_url.empty()) {
    p.emplace_back("urlref", ctx.last_page_url);
  }

  if (ctx.geo)
    p.emplace_back("cip", ctx.geo->ip);
  return p;
}

void append_ecommerce_params(HitParams &p, const EcommerceOrder &order) {
  p.emplace_back("idgoal", "0");
  p.emplace_back("ec_id", order.order_id);
  p.emplace_back("ec_items", order.items_json());
  p.emplace_back("revenue", format_amount(order.revenue));
  p.emplace_back("ec_st", format_amount(order.subtotal));
  p.emplace_back("ec_tx", format_amount(order.tax));
  p.emplace_back("ec_sh", format_amount(order.shipping));
  p.emplace_back("ec_currency", order.currency);
}

TimePoint next_hit_time(VisitContext &ctx, TimePoint planned) {
  TimePoint ts = std::chrono::time_point_cast<seconds>(planned);
  if (ctx.hits_sent > 0 && ts <= ctx.last_hit_time)
    ts = std::chrono::time_point_cast<seconds>(ctx.last_hit_time) + seconds(1);
  ctx.last_hit_time = ts;
  return ts;
}

VisitComposer::VisitComposer(const Config &cfg, HitSender &sender, Random &rng,
                             const std::atomic<bool> *running)
    : cfg_(cfg), sender_(sender), rng_(rng), running_(running) {}

VisitContext VisitComposer::new_visit_context() {
  VisitContext ctx;
  ctx.visitor_id = rng_.hex(16);
  ctx.user_agent = rng_.pick(catalog::user_agents());
  if (!rng_.chance(cfg_.direct_traffic_probability))
    ctx.referrer = rng_.pick(catalog::referrers());
  if (cfg_.randomize_visitor_countries)
    ctx.geo = choose_country_and_ip(rng_);
  return ctx;
}

HitResult VisitComposer::send(VisitContext &ctx, HitParams params) {
  Hit hit{std::move(params), ctx.user_agent};
  HitResult r = sender_.send(hit);
  ++ctx.hits_sent;
  return r;
}

void VisitComposer::pause(milliseconds dur) const {
  if (running_ && dur.count() > 0)
    sleep_with_checks(*running_, dur);
}

void VisitComposer::compose_and_send(const UrlList &urls,
                                     const std::optional<TimeWindow> &window) {
  VisitContext ctx = new_visit_context();
  run(urls, window, ctx, false);
}

void VisitComposer::compose_and_send(const UrlList &urls,
                                     const std::optional<TimeWindow> &window,
                                     VisitContext &ctx) {
  run(urls, window, ctx, ctx.hits_sent > 0);
}

VisitComposer::Plan VisitComposer::make_plan(
    const std::optional<TimeWindow> &window, const VisitContext &ctx,
    bool continuation) {
  Plan plan;
  plan.num_pvs = static_cast<int>(
      rng_.uniform_int(cfg_.pageviews_min, cfg_.pageviews_max));

  // длительность визита делится между просмотрами по случайным весам
  const double duration_s = rng_.uniform_real(cfg_.visit_duration_min * 60.0,
                                              cfg_.visit_duration_max * 60.0);
  std::vector<double> weights(static_cast<std::size_t>(plan.num_pvs));
  double wsum = 0.0;
  for (auto &w : weights) {
    w = rng_.uniform_real(0.5, 1.5);
    wsum += w;
  }
  for (double w : weights)
    plan.dwell.push_back(
        std::max<milliseconds>(seconds(1), seconds_to_ms(duration_s * w / wsum)));

  if (window) {
    const TimePoint lo =
        continuation ? std::max(window->begin, ctx.last_hit_time + seconds(1))
                     : window->begin;
    // ping тоже должен остаться внутри окна, с секундой на округление
    const TimePoint hi = window->end - seconds(2);
    if (hi <= lo) {
      plan.num_pvs = 0;
      return plan;
    }
    const auto span = std::chrono::duration_cast<milliseconds>(hi - lo);
    milliseconds total{0};
    for (const auto &d : plan.dwell)
      total += d;
    if (total > span) {
      const int fit = static_cast<int>(span / seconds(1));
      if (fit < 1) {
        plan.num_pvs = 0;
        return plan;
      }
      plan.num_pvs = std::min(plan.num_pvs, fit);
      plan.dwell.assign(static_cast<std::size_t>(plan.num_pvs),
                        span / plan.num_pvs);
      total = span / plan.num_pvs * plan.num_pvs;
    }
    plan.total = total;
    const auto slack = (span - total).count();
    plan.start = lo + milliseconds(rng_.uniform_int(0, slack));
  } else {
    for (const auto &d : plan.dwell)
      plan.total += d;
    plan.start = std::chrono::time_point_cast<Clock::duration>(
        Clock::now() - plan.total - seconds(1));
  }

  plan.actions = choose_action_pages(
      plan.num_pvs, rng_.chance(cfg_.sitesearch_probability),
      rng_.chance(cfg_.outlinks_probability),
      rng_.chance(cfg_.downloads_probability),
      rng_.chance(cfg_.click_events_probability),
      rng_.chance(cfg_.random_events_probability), rng_);
  drop_beyond(plan.actions, plan.num_pvs);
  return plan;
}

void VisitComposer::run(const UrlList &urls,
                        const std::optional<TimeWindow> &window,
                        VisitContext &ctx, bool continuation) {
  if (urls.empty())
    throw std::invalid_argument("URL list is empty");

  Plan plan = make_plan(window, ctx, continuation);
  if (plan.num_pvs == 0)
    return;

  // продолжение в реальном времени идёт по живым часам, чтобы cdt не
  // ушёл в будущее относительно уже отправленных шагов воронки
  const bool live = !window && continuation;
  auto stamp = [&](TimePoint planned) {
    return next_hit_time(ctx, live ? Clock::now() : planned);
  };
  auto cancelled = [&] { return !still_running(); };

  const bool pacing = pacing_enabled() && !window;
  TimePoint planned = plan.start;
  milliseconds slept{0};
  std::string pv_id;

  for (int i = 1; i <= plan.num_pvs; ++i) {
    if (cancelled())
      return;
    const UrlEntry &entry = rng_.pick(urls);
    const std::string &page = entry.url;
    const TimePoint ts = stamp(planned);
    HitParams p;

    switch (action_at(plan.actions, i)) {
    case PageAction::Search: {
      const std::string &kw = rng_.pick(catalog::search_terms());
      p = make_base_params(ctx, page, ts, rng_, "Search: " + kw);
      pv_id = rng_.hex(6);
      p.emplace_back("pv_id", pv_id);
      p.emplace_back("search", kw);
      if (rng_.chance(0.3))
        p.emplace_back("search_cat", rng_.pick(catalog::search_categories()));
      p.emplace_back("search_count", std::to_string(rng_.uniform_int(0, 25)));
      break;
    }
    case PageAction::Outlink: {
      const std::string &link = rng_.pick(catalog::outlinks());
      p = make_base_params(ctx, link, ts, rng_, {}, page);
      p.emplace_back("link", link);
      log_info("VISIT", "outlink visitor=" + ctx.visitor_id + " link=" + link +
                            " referer=" + page);
      break;
    }
    case PageAction::Download: {
      const std::string file =
          resolve_download_url(page, rng_.pick(catalog::downloads()));
      p = make_base_params(ctx, file, ts, rng_, {}, page);
      p.emplace_back("download", file);
      log_info("VISIT", "download visitor=" + ctx.visitor_id + " file=" +
                            file + " referer=" + page);
      break;
    }
    case PageAction::ClickEvent:
      p = make_base_params(ctx, page, ts, rng_);
      append_event_params(p, rng_.pick(catalog::click_events()));
      break;
    case PageAction::RandomEvent:
      p = make_base_params(ctx, page, ts, rng_);
      append_event_params(p, rng_.pick(catalog::random_events()));
      break;
    case PageAction::Pageview:
      p = make_base_params(ctx, page, ts, rng_, action_name_for(entry));
      pv_id = rng_.hex(6);
      p.emplace_back("pv_id", pv_id);
      log_dbg("VISIT", "pageview visitor=" + ctx.visitor_id + " url=" + page);
      break;
    }

    send(ctx, std::move(p));
    // для outlink/download последней остаётся страница со ссылкой
    ctx.last_page_url = page;

    if (i < plan.num_pvs) {
      planned += plan.dwell[static_cast<std::size_t>(i - 1)];
      if (pacing) {
        const auto gap = seconds_to_ms(rng_.uniform_real(
            cfg_.pause_between_pvs_min, cfg_.pause_between_pvs_max));
        pause(gap);
        slept += gap;
      }
    }
  }

  const milliseconds last_dwell = plan.dwell.back();
  const TimePoint last_pv = planned;

  if (auto order = generate_ecommerce_order(cfg_, rng_)) {
    if (cancelled())
      return;
    const TimePoint ts =
        stamp(last_pv + std::min<milliseconds>(seconds(1), last_dwell / 2));
    HitParams p = make_base_params(ctx, ctx.last_page_url, ts, rng_);
    append_ecommerce_params(p, *order);
    log_dbg("VISIT", "order visitor=" + ctx.visitor_id + " id=" +
                         order->order_id +
                         " revenue=" + format_amount(order->revenue));
    send(ctx, std::move(p));
  }

  // остаток длительности визита перед ping
  if (pacing && plan.total > slept)
    pause(plan.total - slept);
  if (cancelled())
    return;

  HitParams ping = make_base_params(ctx, ctx.last_page_url,
                                    stamp(last_pv + last_dwell), rng_);
  if (!pv_id.empty())
    ping.emplace_back("pv_id", pv_id);
  ping.emplace_back("ping", "1");
  send(ctx, std::move(ping));
}

} // namespace trafficgen
