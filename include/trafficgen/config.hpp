#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace trafficgen {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Config {
  // Трекер (одиночная цель, если MULTI_TARGET_CONFIG пуст)
  std::string matomo_url = "https://matomo.example.com/matomo.php";
  int site_id = 1;
  std::string token_auth;
  std::string urls_file = "/config/urls.txt";
  std::string funnels_file;

  // Темп и пул
  double target_visits_per_day = 20000;
  int pageviews_min = 3;
  int pageviews_max = 6;
  std::size_t concurrency = 50;
  double pause_between_pvs_min = 0.5;
  double pause_between_pvs_max = 2.0;

  // Автостоп и лимиты (0 = выключено)
  double auto_stop_after_hours = 0;
  std::uint64_t max_total_visits = 0;
  std::uint64_t daily_visit_cap = 0;

  // Вероятности действий внутри визита
  double sitesearch_probability = 0.15;
  double outlinks_probability = 0.10;
  double downloads_probability = 0.08;
  double click_events_probability = 0.25;
  double random_events_probability = 0.12;
  double direct_traffic_probability = 0.30;
  double ecommerce_probability = 0.05;

  // Длительность визита, минуты
  double visit_duration_min = 1.0;
  double visit_duration_max = 8.0;

  bool randomize_visitor_countries = true;

  // Ecommerce
  double ecommerce_order_value_min = 15.99;
  double ecommerce_order_value_max = 299.99;
  int ecommerce_items_min = 1;
  int ecommerce_items_max = 5;
  double ecommerce_tax_rate = 0.25;
  std::vector<double> ecommerce_shipping_rates{0.0, 49.0, 99.0};
  std::string ecommerce_currency = "SEK";

  std::string timezone = "CET";
  double request_timeout_seconds = 10;

  // Backfill
  bool backfill_enabled = false;
  bool backfill_run_once = true;
  std::optional<std::string> backfill_start_date;
  std::optional<std::string> backfill_end_date;
  std::optional<int> backfill_days_back;
  std::optional<int> backfill_duration_days;
  std::uint64_t backfill_max_visits_per_day = 2000;
  std::uint64_t backfill_max_visits_total = 200000;
  std::optional<double> backfill_rps_limit;
  std::optional<std::uint32_t> backfill_seed;

  // JSON {targets:[...], distribution_strategy}
  std::string multi_target_config;

  // Ожидание сигнала старта
  bool auto_start = true;
  std::string start_signal_file = "/app/data/loadgen.start";
  double start_check_interval = 1.0;

  // HTTP-эндпоинт статуса/перезагрузки воронок (0 = выключен)
  std::string control_host = "0.0.0.0";
  unsigned short control_port = 0;

  // Зеркало статуса в Redis
  bool redis_enabled = false;
  std::string redis_host = "127.0.0.1";
  int redis_port = 6379;

  std::string log_level = "INFO";
};

// Значения из JSON-файла поверх умолчаний; отсутствующий файл не ошибка
void apply_config_file(Config &cfg, const std::string &path);

// Переменные окружения поверх текущих значений
void apply_env(Config &cfg);

// Проверка диапазонов; бросает ConfigError
void validate(const Config &cfg);

// defaults -> файл -> окружение -> validate
Config load_config(const std::string &path);

} // namespace trafficgen
