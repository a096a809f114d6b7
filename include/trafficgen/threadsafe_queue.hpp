#pragma once
#include <boost/thread.hpp>
#include <cstddef>
#include <deque>

namespace trafficgen {

// Ограниченная очередь между продюсером и воркерами
template <class T>
class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(std::size_t cap) : capacity_(cap ? cap : 1) {}

  // блокирует, пока есть место
  void push(T v) {
    boost::unique_lock<boost::mutex> lk(m_);
    cv_not_full_.wait(lk, [&]{ return q_.size() < capacity_; });
    q_.push_back(std::move(v));
    cv_not_empty_.notify_one();
  }

  // неблокирующая попытка
  bool try_push(T v) {
    boost::unique_lock<boost::mutex> lk(m_);
    if (q_.size() >= capacity_) return false;
    q_.push_back(std::move(v));
    cv_not_empty_.notify_one();
    return true;
  }

  // блокирующее извлечение
  T pop() {
    boost::unique_lock<boost::mutex> lk(m_);
    cv_not_empty_.wait(lk, [&]{ return !q_.empty(); });
    T v = std::move(q_.front());
    q_.pop_front();
    cv_not_full_.notify_one();
    return v;
  }

  // выбрасывает ещё не взятые задания, возвращает их число
  std::size_t clear() {
    std::size_t n = 0;
    {
      boost::lock_guard<boost::mutex> lk(m_);
      n = q_.size();
      q_.clear();
    }
    cv_not_full_.notify_all();
    return n;
  }

  bool full() const {
    boost::lock_guard<boost::mutex> lk(m_);
    return q_.size() >= capacity_;
  }

private:
  std::deque<T> q_;
  std::size_t capacity_;
  mutable boost::mutex m_;
  boost::condition_variable_any cv_not_empty_;
  boost::condition_variable_any cv_not_full_;
};

} // namespace trafficgen
