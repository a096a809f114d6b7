#pragma once
#include "config.hpp"
#include "ecommerce.hpp"
#include "hit_sender.hpp"
#include "random.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace trafficgen {

// Номера просмотров (1..N) для действий визита, -1 = действия нет
struct ActionPages {
  int search{-1};
  int outlink{-1};
  int download{-1};
  int click_event{-1};
  int random_event{-1};
};

enum class PageAction { Pageview, Search, Outlink, Download, ClickEvent, RandomEvent };

// Каждое желаемое действие получает номер из [2, N]; при N <= 1 действий нет
ActionPages choose_action_pages(int num_pvs, bool want_search,
                                bool want_outlink, bool want_download,
                                bool want_click, bool want_random,
                                Random &rng);

// Что отправить на просмотре index. При совпадении номеров:
// search > outlink > download > click > random.
PageAction action_at(const ActionPages &pages, int index);

// Абсолютный URL загрузки; относительный путь берётся от scheme://host страницы
std::string resolve_download_url(const std::string &page_url,
                                 const std::string &file);

// Общие поля хита: rec, _id, rand, cdt, url, [action_name], new_visit/urlref,
// cip. referrer_override задаёт urlref вместо последней страницы.
HitParams make_base_params(const VisitContext &ctx, const std::string &url,
                           TimePoint ts, Random &rng,
                           const std::string &action_name = {},
                           const std::optional<std::string> &referrer_override =
                               std::nullopt);

void append_ecommerce_params(HitParams &params, const EcommerceOrder &order);

// Метка очередного хита визита: целые секунды, строго после предыдущего
// хита (cdt передаётся с точностью до секунды)
TimePoint next_hit_time(VisitContext &ctx, TimePoint planned);

// Случайный визит: N просмотров, действия, заказ, финальный ping.
// С окном все метки времени внутри окна и без пауз; без окна визит
// заканчивается "сейчас", а воркер спит паузы между хитами (если задан
// running).
class VisitComposer {
public:
  VisitComposer(const Config &cfg, HitSender &sender, Random &rng,
                const std::atomic<bool> *running = nullptr);

  VisitContext new_visit_context();

  void compose_and_send(const UrlList &urls,
                        const std::optional<TimeWindow> &window);

  // Продолжение визита после воронки: тот же посетитель, без new_visit,
  // метки времени после ctx.last_hit_time
  void compose_and_send(const UrlList &urls,
                        const std::optional<TimeWindow> &window,
                        VisitContext &ctx);

  // отправка с учётом счётчиков контекста
  HitResult send(VisitContext &ctx, HitParams params);

  // пауза реального времени; no-op без running
  void pause(std::chrono::milliseconds dur) const;
  bool pacing_enabled() const noexcept { return running_ != nullptr; }
  bool still_running() const { return !running_ || running_->load(); }

  const Config &config() const noexcept { return cfg_; }
  Random &rng() noexcept { return rng_; }

private:
  struct Plan {
    int num_pvs{0};
    ActionPages actions;
    std::vector<std::chrono::milliseconds> dwell; // после каждого просмотра
    std::chrono::milliseconds total{0};
    TimePoint start{};
  };

  Plan make_plan(const std::optional<TimeWindow> &window,
                 const VisitContext &ctx, bool continuation);
  void run(const UrlList &urls, const std::optional<TimeWindow> &window,
           VisitContext &ctx, bool continuation);

  const Config cfg_;
  HitSender &sender_;
  Random &rng_;
  const std::atomic<bool> *running_;
};

} // namespace trafficgen
