#pragma once
#include "funnel.hpp"
#include "types.hpp"
#include "visit_composer.hpp"

#include <optional>

namespace trafficgen {

// Один визит целиком; планировщики зовут его из воркеров
class VisitSource {
public:
  virtual ~VisitSource() = default;
  virtual void run_visit(const std::optional<TimeWindow> &window) = 0;
};

// Сначала попытка воронки, иначе (или после воронки без выхода)
// обычный случайный визит
class VisitDispatcher : public VisitSource {
public:
  VisitDispatcher(VisitComposer &composer, FunnelEngine &engine,
                  const UrlList &urls);

  void run_visit(const std::optional<TimeWindow> &window) override;

private:
  VisitComposer &composer_;
  FunnelEngine &engine_;
  const UrlList &urls_;
};

} // namespace trafficgen
