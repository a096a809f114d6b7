#include "trafficgen/backfill.hpp"
#include "trafficgen/config.hpp"
#include "trafficgen/control_server.hpp"
#include "trafficgen/funnel.hpp"
#include "trafficgen/hit_sender.hpp"
#include "trafficgen/log.hpp"
#include "trafficgen/metrics_export.hpp"
#include "trafficgen/random.hpp"
#include "trafficgen/scheduler.hpp"
#include "trafficgen/status_publisher.hpp"
#include "trafficgen/start_gate.hpp"
#include "trafficgen/target_router.hpp"
#include "trafficgen/url_list.hpp"
#include "trafficgen/visit_composer.hpp"
#include "trafficgen/visit_source.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <memory>

#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace trafficgen;

static void term_handler() {
  try {
    throw; // поймать текущее исключение
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[FATAL] std::terminate: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "[FATAL] std::terminate: unknown exception\n");
  }
  std::fflush(stderr);
  std::abort();
}

static void log_startup(const Config &cfg, const TargetRouter &router,
                        std::size_t urls, std::size_t funnels) {
  char buf[512];
  std::snprintf(buf, sizeof(buf),
                "targets=%zu strategy=%s urls=%zu funnels=%zu "
                "visits/day=%.0f pageviews=%d..%d concurrency=%zu tz=%s",
                router.enabled_targets().size(), to_string(router.strategy()),
                urls, funnels, cfg.target_visits_per_day, cfg.pageviews_min,
                cfg.pageviews_max, cfg.concurrency, cfg.timezone.c_str());
  log_info("CFG", buf);
  if (cfg.auto_stop_after_hours > 0 || cfg.max_total_visits > 0 ||
      cfg.daily_visit_cap > 0) {
    std::snprintf(buf, sizeof(buf),
                  "auto_stop=%.2fh max_total=%llu daily_cap=%llu",
                  cfg.auto_stop_after_hours,
                  static_cast<unsigned long long>(cfg.max_total_visits),
                  static_cast<unsigned long long>(cfg.daily_visit_cap));
    log_info("CFG", buf);
  }
  if (cfg.backfill_enabled)
    log_info("CFG", std::string("backfill enabled, run_once=") +
                        (cfg.backfill_run_once ? "true" : "false"));
}

int main(int argc, char **argv) {
  std::set_terminate(term_handler);

  std::string cfg_path;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      cfg_path = argv[++i];
  }

  Config cfg;
  Random rng;
  std::unique_ptr<TargetRouter> router;
  std::unique_ptr<HttpHitSender> sender;
  UrlList urls;
  try {
    cfg = load_config(cfg_path);
    set_log_level(cfg.log_level);
    if (cfg.backfill_seed)
      rng.reseed(*cfg.backfill_seed);
    router = make_router(cfg, rng);
    sender = std::make_unique<HttpHitSender>(cfg, *router);
    urls = read_urls(cfg.urls_file);
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[FATAL] startup error: %s\n", e.what());
    return 1;
  }

  std::atomic<bool> running{true};

  FunnelRegistry registry(cfg.funnels_file);
  registry.reload();
  VisitComposer composer(cfg, *sender, rng, &running);
  FunnelEngine engine(composer, registry);
  VisitDispatcher dispatcher(composer, engine, urls);
  StatusPublisher publisher(cfg);

  log_startup(cfg, *router, urls.size(), registry.size());

  boost::asio::io_context ioc;
  auto guard = boost::asio::make_work_guard(ioc.get_executor());

  std::unique_ptr<ControlServer> control;
  if (cfg.control_port > 0) {
    try {
      control = std::make_unique<ControlServer>(
          ioc, cfg.control_host, cfg.control_port,
          [&router] {
            return json{
                {"visits_total", g_visits_total.load()},
                {"hits_sent", g_hits_sent.load()},
                {"hits_failed", g_hits_failed.load()},
                {"router", router->report()},
            };
          },
          [&registry] { return registry.reload(); });
      control->run();
      log_info("CTL", "control endpoint on " + cfg.control_host + ":" +
                          std::to_string(control->port()));
    } catch (const std::exception &e) {
      log_warn("CTL", std::string("control endpoint disabled: ") + e.what());
      control.reset();
    }
  }

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&running](const boost::system::error_code &ec, int) {
    if (ec)
      return;
    log_info("SIG", "stopping...");
    running = false;
  });

  boost::thread io_thread([&ioc] { ioc.run(); });

  const auto t0 = std::chrono::steady_clock::now();
  if (wait_for_start_signal(cfg, running)) {
    if (cfg.backfill_enabled) {
      publisher.publish(current_status(0.0, "backfill"));
      BackfillScheduler backfill(cfg, dispatcher, rng, running);
      for (const auto &d : backfill.run_backfill()) {
        if (d.skipped)
          log_info("BACKFILL", d.date + " skipped");
        else
          log_info("BACKFILL", d.date + " sent=" + std::to_string(d.sent) +
                                   " target=" + std::to_string(d.target));
      }
    }
    if (running && (!cfg.backfill_enabled || !cfg.backfill_run_once)) {
      RealtimeScheduler realtime(cfg, dispatcher, running);
      realtime.set_progress_callback([&publisher](const RunSummary &s) {
        publisher.publish(current_status(s.implied_daily_rate, "realtime"));
      });
      realtime.run();
    }
  }

  const RunSummary summary = make_summary(
      g_visits_total.load(),
      std::chrono::duration<double>(std::chrono::steady_clock::now() - t0)
          .count());
  char buf[160];
  std::snprintf(buf, sizeof(buf), "Done. Sent %llu visits in %.1f s (~%.0f/day).",
                static_cast<unsigned long long>(summary.total_visits),
                summary.elapsed_seconds, summary.implied_daily_rate);
  log_info("RUN", buf);
  log_info("ROUTER", router->report().dump(2));
  publisher.publish(current_status(summary.implied_daily_rate, "done"));

  if (control)
    control->stop();
  boost::system::error_code ignored;
  signals.cancel(ignored);
  guard.reset();
  ioc.stop();
  io_thread.join();
  return 0;
}
