#pragma once
#include "config.hpp"
#include "ecommerce.hpp"
#include "hit_sender.hpp"
#include "random.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

#include <boost/thread/mutex.hpp>
#include <nlohmann/json_fwd.hpp>

namespace trafficgen {

class VisitComposer;

enum class StepType { Pageview, Event, SiteSearch, Outlink, Download, Ecommerce };

const char *to_string(StepType t);
// "pageview", "event", "site_search" ("search"), "outlink", "download",
// "ecommerce"; иначе std::invalid_argument
StepType parse_step_type(const std::string &s);

struct FunnelStep {
  StepType type{StepType::Pageview};
  std::string url;         // pageview; для остальных страница шага
  std::string action_name;
  EventDef event;          // event
  std::string search_keyword;
  std::string search_category;
  std::optional<int> search_results;
  std::string target_url;  // outlink / download
  EcommerceOverrides ecommerce;
  double delay_min{1.0};   // секунды после шага
  double delay_max{2.0};
};

struct Funnel {
  std::string name;
  std::string description;
  double probability{0.0};
  int priority{0};
  bool enabled{true};
  bool exit_after_completion{true};
  std::vector<FunnelStep> steps;
};

// Разбор одной воронки; бросает std::invalid_argument с причиной
Funnel parse_funnel(const nlohmann::json &j);

// Массив определений: битые записи и выключенные воронки пропускаются
// (битые с предупреждением). Результат отсортирован по priority.
std::vector<Funnel> parse_funnels(const nlohmann::json &arr);

// Отсутствующий или нечитаемый файл -> пустой список с предупреждением
std::vector<Funnel> load_funnels_from_file(const std::string &path);

// Набор активных воронок процесса. reload() можно звать из любого потока.
class FunnelRegistry {
public:
  explicit FunnelRegistry(std::string path = {});

  // перечитывает файл, возвращает число загруженных воронок
  std::size_t reload();
  // подмена списка (тесты, встроенные определения)
  void set(std::vector<Funnel> funnels);

  std::vector<Funnel> snapshot() const;
  std::size_t size() const;

private:
  std::string path_;
  mutable boost::mutex m_;
  std::vector<Funnel> funnels_;
};

// Выполнение воронки шаг за шагом поверх хитов VisitComposer
class FunnelEngine {
public:
  FunnelEngine(VisitComposer &composer, FunnelRegistry &registry);

  // По возрастанию priority, независимый бросок на каждую воронку;
  // первая выпавшая выигрывает
  std::optional<Funnel> select_funnel();

  // Возвращает exit_after_completion воронки. ctx: контекст визита,
  // после выполнения в нём последняя страница и время последнего хита.
  bool execute(const Funnel &funnel, const UrlList &urls,
               const std::optional<TimeWindow> &window, VisitContext &ctx);

private:
  VisitComposer &composer_;
  FunnelRegistry &registry_;
};

} // namespace trafficgen
