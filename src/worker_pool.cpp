#include "trafficgen/worker_pool.hpp"
#include "trafficgen/log.hpp"
#include "trafficgen/metrics_export.hpp"

#include <exception>
#include <string>

namespace trafficgen {

WorkerPool::WorkerPool(std::size_t size, VisitSource &source)
    : size_(size ? size : 1), source_(source), queue_(size_ * 2) {}

WorkerPool::~WorkerPool() { cancel(); }

void WorkerPool::start() {
  if (!workers_.empty())
    return;

  workers_.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) {
    workers_.emplace_back(std::make_unique<boost::thread>([this] {
      try {
        worker_loop();
      } catch (const std::exception &e) {
        log_err("ERR", std::string("worker fatal: ") + e.what());
      }
    }));
  }
}

bool WorkerPool::try_submit(VisitJob job) {
  return queue_.try_push(std::move(job));
}

void WorkerPool::drain() {
  if (workers_.empty())
    return;
  // sentinel встают за уже поставленными заданиями
  for (std::size_t i = 0; i < workers_.size(); ++i)
    queue_.push(stop_job());
  join_all();
}

void WorkerPool::cancel() {
  if (workers_.empty())
    return;
  const std::size_t dropped = queue_.clear();
  if (dropped)
    log_dbg("POOL", "dropped " + std::to_string(dropped) + " queued visit(s)");
  for (std::size_t i = 0; i < workers_.size(); ++i)
    queue_.push(stop_job());
  join_all();
}

void WorkerPool::join_all() {
  for (auto &w : workers_) {
    if (w && w->joinable())
      w->join();
  }
  workers_.clear();
  queue_.clear();
}

void WorkerPool::worker_loop() {
  while (true) {
    const VisitJob job = queue_.pop();
    if (job.stop)
      break;

    try {
      source_.run_visit(job.window);
    } catch (const std::exception &e) {
      // ошибка одного визита не останавливает пул
      log_dbg("VISIT", std::string("visit aborted: ") + e.what());
    }
    completed_.fetch_add(1, std::memory_order_relaxed);
    g_visits_total.fetch_add(1ULL, std::memory_order_relaxed);
  }
}

} // namespace trafficgen
