#include "trafficgen/target_router.hpp"

#include <stdexcept>
#include <unordered_set>

#include <boost/thread/locks.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace trafficgen {

const char *to_string(HealthStatus s) {
  switch (s) {
  case HealthStatus::Healthy:
    return "healthy";
  case HealthStatus::Degraded:
    return "degraded";
  case HealthStatus::Failed:
    return "failed";
  case HealthStatus::Unknown:
    break;
  }
  return "unknown";
}

const char *to_string(DistributionStrategy s) {
  switch (s) {
  case DistributionStrategy::Weighted:
    return "weighted";
  case DistributionStrategy::Random:
    return "random";
  case DistributionStrategy::RoundRobin:
    break;
  }
  return "round-robin";
}

DistributionStrategy parse_strategy(const std::string &s) {
  if (s == "round-robin")
    return DistributionStrategy::RoundRobin;
  if (s == "weighted")
    return DistributionStrategy::Weighted;
  if (s == "random")
    return DistributionStrategy::Random;
  throw std::invalid_argument("unknown distribution_strategy '" + s + "'");
}

// --- TargetMetrics ---------------------------------------------------------

std::optional<double> TargetMetrics::Snapshot::avg_latency_ms() const {
  if (successful_requests == 0)
    return std::nullopt;
  return total_latency_ms / static_cast<double>(successful_requests);
}

double TargetMetrics::Snapshot::success_rate() const {
  if (total_requests == 0)
    return 0.0;
  return static_cast<double>(successful_requests) /
         static_cast<double>(total_requests);
}

HealthStatus TargetMetrics::Snapshot::status() const {
  if (total_requests == 0)
    return HealthStatus::Unknown;
  const double rate = success_rate();
  if (rate >= 0.95)
    return HealthStatus::Healthy;
  if (rate >= 0.70)
    return HealthStatus::Degraded;
  return HealthStatus::Failed;
}

TargetMetrics::TargetMetrics(std::string target_name) {
  s_.target_name = std::move(target_name);
}

void TargetMetrics::record_success(double latency_ms) {
  boost::lock_guard<boost::mutex> lk(m_);
  ++s_.total_requests;
  ++s_.successful_requests;
  s_.total_latency_ms += latency_ms;
  s_.last_success = Clock::now();
}

void TargetMetrics::record_failure(const std::string &reason) {
  boost::lock_guard<boost::mutex> lk(m_);
  ++s_.total_requests;
  ++s_.failed_requests;
  s_.last_error = reason;
  s_.last_failure = Clock::now();
}

TargetMetrics::Snapshot TargetMetrics::snapshot() const {
  boost::lock_guard<boost::mutex> lk(m_);
  return s_;
}

// --- TargetRouter ----------------------------------------------------------

TargetRouter::TargetRouter(std::vector<Target> targets,
                           DistributionStrategy strategy, Random &rng)
    : all_(std::move(targets)), strategy_(strategy), rng_(rng) {
  std::unordered_set<std::string> names;
  for (const auto &t : all_) {
    if (!names.insert(t.name).second)
      throw std::invalid_argument("duplicate target name '" + t.name + "'");
    metrics_.emplace(t.name, std::make_unique<TargetMetrics>(t.name));
    if (t.enabled)
      enabled_.push_back(t);
  }
  if (enabled_.empty())
    throw std::invalid_argument("At least one target must be enabled");

  if (strategy_ == DistributionStrategy::Weighted) {
    for (const auto &t : enabled_) {
      if (t.weight < 1)
        throw std::invalid_argument(
            "All enabled targets must have weight >= 1 for weighted "
            "distribution (target '" +
            t.name + "')");
      weights_.push_back(static_cast<double>(t.weight));
    }
  }
}

const Target &TargetRouter::next_target() {
  switch (strategy_) {
  case DistributionStrategy::Weighted:
    return enabled_[rng_.weighted_index(weights_)];
  case DistributionStrategy::Random:
    return rng_.pick(enabled_);
  case DistributionStrategy::RoundRobin:
    break;
  }
  const auto i = index_.fetch_add(1, std::memory_order_relaxed);
  return enabled_[i % enabled_.size()];
}

TargetMetrics &TargetRouter::metrics_for(const std::string &name) const {
  auto it = metrics_.find(name);
  if (it == metrics_.end())
    throw std::out_of_range("unknown target '" + name + "'");
  return *it->second;
}

void TargetRouter::record_success(const std::string &target_name,
                                  double latency_ms) {
  metrics_for(target_name).record_success(latency_ms);
}

void TargetRouter::record_failure(const std::string &target_name,
                                  const std::string &reason) {
  metrics_for(target_name).record_failure(reason);
}

TargetMetrics::Snapshot
TargetRouter::metrics(const std::string &target_name) const {
  return metrics_for(target_name).snapshot();
}

json TargetRouter::report() const {
  std::uint64_t requests = 0, successes = 0, failures = 0;
  json per_target = json::object();
  for (const auto &t : all_) {
    const auto m = metrics_for(t.name).snapshot();
    requests += m.total_requests;
    successes += m.successful_requests;
    failures += m.failed_requests;
    const auto avg = m.avg_latency_ms();
    per_target[t.name] = {
        {"requests", m.total_requests},
        {"successes", m.successful_requests},
        {"failures", m.failed_requests},
        {"success_rate", m.success_rate()},
        {"avg_latency_ms", avg ? json(*avg) : json(nullptr)},
        {"status", to_string(m.status())},
    };
  }
  return json{
      {"total_targets", all_.size()},
      {"enabled_targets", enabled_.size()},
      {"strategy", to_string(strategy_)},
      {"total_requests", requests},
      {"total_successes", successes},
      {"total_failures", failures},
      {"overall_success_rate",
       requests > 0 ? static_cast<double>(successes) /
                          static_cast<double>(requests)
                    : 0.0},
      {"per_target", per_target},
  };
}

// --- конфигурация ----------------------------------------------------------

std::string normalize_endpoint(const std::string &url) {
  std::string out = url;
  while (!out.empty() && out.back() == '/')
    out.pop_back();
  const auto scheme = out.find("://");
  const auto path = out.find('/', scheme == std::string::npos ? 0 : scheme + 3);
  const bool has_php = path != std::string::npos &&
                       out.size() >= 4 &&
                       out.compare(out.size() - 4, 4, ".php") == 0;
  if (!has_php)
    out += "/matomo.php";
  return out;
}

std::optional<MultiTargetConfig> parse_targets(const std::string &blob) {
  if (blob.empty())
    return std::nullopt;
  try {
    const json cfg = json::parse(blob);
    const json targets =
        cfg.contains("targets") ? cfg.at("targets") : json::array();
    if (!targets.is_array())
      throw ConfigError("MULTI_TARGET_CONFIG: 'targets' must be an array");
    if (targets.empty())
      return std::nullopt;

    MultiTargetConfig out;
    for (const auto &t : targets) {
      Target tg;
      tg.name = t.at("name").get<std::string>();
      tg.url = normalize_endpoint(t.at("url").get<std::string>());
      const auto &sid = t.at("site_id");
      tg.site_id = sid.is_string() ? std::stoi(sid.get<std::string>())
                                   : sid.get<int>();
      if (t.contains("token_auth") && t["token_auth"].is_string() &&
          !t["token_auth"].get<std::string>().empty())
        tg.token_auth = t["token_auth"].get<std::string>();
      tg.weight = t.value("weight", 1);
      tg.enabled = t.value("enabled", true);
      out.targets.push_back(std::move(tg));
    }
    out.strategy = parse_strategy(
        cfg.value("distribution_strategy", std::string("round-robin")));
    return out;
  } catch (const ConfigError &) {
    throw;
  } catch (const std::exception &e) {
    throw ConfigError(std::string("Failed to parse MULTI_TARGET_CONFIG: ") +
                      e.what());
  }
}

std::unique_ptr<TargetRouter> make_router(const Config &cfg, Random &rng) {
  auto multi = parse_targets(cfg.multi_target_config);
  try {
    if (multi)
      return std::make_unique<TargetRouter>(std::move(multi->targets),
                                            multi->strategy, rng);
    Target def;
    def.name = "default";
    def.url = normalize_endpoint(cfg.matomo_url);
    def.site_id = cfg.site_id;
    if (!cfg.token_auth.empty())
      def.token_auth = cfg.token_auth;
    std::vector<Target> one{def};
    return std::make_unique<TargetRouter>(std::move(one),
                                          DistributionStrategy::RoundRobin,
                                          rng);
  } catch (const std::invalid_argument &e) {
    throw ConfigError(e.what());
  }
}

} // namespace trafficgen
