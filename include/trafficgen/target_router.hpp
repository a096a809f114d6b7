#pragma once
#include "config.hpp"
#include "random.hpp"
#include "types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/thread/mutex.hpp>
#include <nlohmann/json_fwd.hpp>

namespace trafficgen {

struct Target {
  std::string name; // уникальное
  std::string url;
  int site_id{1};
  std::optional<std::string> token_auth;
  int weight{1};
  bool enabled{true};
};

enum class HealthStatus { Healthy, Degraded, Failed, Unknown };
enum class DistributionStrategy { RoundRobin, Weighted, Random };

const char *to_string(HealthStatus s);
const char *to_string(DistributionStrategy s);
// "round-robin" | "weighted" | "random"; иначе std::invalid_argument
DistributionStrategy parse_strategy(const std::string &s);

// Счётчики одной цели. Пишут все воркеры, поэтому под мьютексом.
class TargetMetrics {
public:
  struct Snapshot {
    std::string target_name;
    std::uint64_t total_requests{0};
    std::uint64_t successful_requests{0};
    std::uint64_t failed_requests{0};
    double total_latency_ms{0};
    std::optional<std::string> last_error;
    std::optional<TimePoint> last_success;
    std::optional<TimePoint> last_failure;

    // только по успешным
    std::optional<double> avg_latency_ms() const;
    double success_rate() const;
    // healthy >= 95%, degraded >= 70%, иначе failed; unknown без запросов
    HealthStatus status() const;
  };

  explicit TargetMetrics(std::string target_name);

  void record_success(double latency_ms);
  void record_failure(const std::string &reason);
  Snapshot snapshot() const;

private:
  mutable boost::mutex m_;
  Snapshot s_;
};

class TargetRouter {
public:
  // Бросает std::invalid_argument, если нет включённых целей или при
  // weighted у включённой цели weight < 1. Вес выключенных не проверяется.
  TargetRouter(std::vector<Target> targets, DistributionStrategy strategy,
               Random &rng);

  // Чистый выбор, без I/O
  const Target &next_target();

  void record_success(const std::string &target_name, double latency_ms);
  void record_failure(const std::string &target_name,
                      const std::string &reason);

  const std::vector<Target> &all_targets() const noexcept { return all_; }
  const std::vector<Target> &enabled_targets() const noexcept {
    return enabled_;
  }
  DistributionStrategy strategy() const noexcept { return strategy_; }

  TargetMetrics::Snapshot metrics(const std::string &target_name) const;

  // {total_targets, enabled_targets, strategy, total_requests, ...,
  //  per_target: {name: {requests, successes, failures, success_rate,
  //                      avg_latency_ms, status}}}
  nlohmann::json report() const;

private:
  TargetMetrics &metrics_for(const std::string &name) const;

  std::vector<Target> all_;
  std::vector<Target> enabled_;
  std::vector<double> weights_;
  DistributionStrategy strategy_;
  Random &rng_;
  std::atomic<std::uint64_t> index_{0};
  std::unordered_map<std::string, std::unique_ptr<TargetMetrics>> metrics_;
};

struct MultiTargetConfig {
  std::vector<Target> targets;
  DistributionStrategy strategy{DistributionStrategy::RoundRobin};
};

// Разбор MULTI_TARGET_CONFIG. Пустая строка или пустой список -> nullopt;
// битый JSON или поля -> ConfigError.
std::optional<MultiTargetConfig> parse_targets(const std::string &blob);

// убирает завершающий '/', дописывает /matomo.php, если путь не *.php
std::string normalize_endpoint(const std::string &url);

// Маршрутизатор из конфигурации; без MULTI_TARGET_CONFIG одна неявная цель
std::unique_ptr<TargetRouter> make_router(const Config &cfg, Random &rng);

} // namespace trafficgen
