#pragma once
#include "threadsafe_queue.hpp"
#include "visit_job.hpp"
#include "visit_source.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include <boost/thread.hpp>

namespace trafficgen {

// Фиксированный пул воркеров над ограниченной очередью (2 x size).
// Каждый воркер берёт VisitJob и выполняет визит через VisitSource.
class WorkerPool {
public:
  WorkerPool(std::size_t size, VisitSource &source);
  ~WorkerPool();

  void start();

  // неблокирующая постановка; false, если очередь полна
  bool try_submit(VisitJob job);
  bool queue_full() const { return queue_.full(); }

  // штатное завершение: очередь дорабатывается, затем sentinel на воркер
  void drain();
  // отмена: невзятые задания выбрасываются, воркеры дожидаются
  void cancel();

  // визиты, отработанные воркерами (удачные и нет)
  std::uint64_t completed() const {
    return completed_.load(std::memory_order_relaxed);
  }

private:
  void worker_loop();
  void join_all();

  const std::size_t size_;
  VisitSource &source_;
  ThreadSafeQueue<VisitJob> queue_;
  std::vector<std::unique_ptr<boost::thread>> workers_;
  std::atomic<std::uint64_t> completed_{0};
};

} // namespace trafficgen
