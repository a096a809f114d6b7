#include "trafficgen/visit_source.hpp"

namespace trafficgen {

VisitDispatcher::VisitDispatcher(VisitComposer &composer, FunnelEngine &engine,
                                 const UrlList &urls)
    : composer_(composer), engine_(engine), urls_(urls) {}

void VisitDispatcher::run_visit(const std::optional<TimeWindow> &window) {
  if (auto funnel = engine_.select_funnel()) {
    VisitContext ctx = composer_.new_visit_context();
    const bool exit = engine_.execute(*funnel, urls_, window, ctx);
    if (!exit && composer_.still_running())
      composer_.compose_and_send(urls_, window, ctx);
    return;
  }
  composer_.compose_and_send(urls_, window);
}

} // namespace trafficgen
