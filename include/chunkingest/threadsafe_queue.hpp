#pragma once
#include <boost/thread.hpp>
#include <deque>
#include <optional>

namespace chunkingest {

template <class T>
class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(std::size_t cap) : capacity_(cap) {}

  // неблокирующая попытка; false — очередь полна или остановлена
  bool try_push(T v) {
    boost::unique_lock<boost::mutex> lk(m_);
    if (stopped_ || q_.size() >= capacity_) return false;
    q_.push_back(std::move(v));
    cv_not_empty_.notify_one();
    return true;
  }

  // блокирующее извлечение; nullopt — только после stop() и опустошения
  std::optional<T> pop() {
    boost::unique_lock<boost::mutex> lk(m_);
    cv_not_empty_.wait(lk, [&]{ return stopped_ || !q_.empty(); });
    if (q_.empty()) return std::nullopt;
    T v = std::move(q_.front());
    q_.pop_front();
    return v;
  }

  // неблокирующее извлечение — добрать пачку
  std::optional<T> try_pop() {
    boost::lock_guard<boost::mutex> lk(m_);
    if (q_.empty()) return std::nullopt;
    T v = std::move(q_.front());
    q_.pop_front();
    return v;
  }

  std::size_t size() const {
    boost::lock_guard<boost::mutex> lk(m_);
    return q_.size();
  }

  void stop() {
    {
      boost::lock_guard<boost::mutex> lk(m_);
      stopped_ = true;
    }
    cv_not_empty_.notify_all();
  }

private:
  std::deque<T> q_;
  std::size_t capacity_;
  bool stopped_{false};
  mutable boost::mutex m_;
  boost::condition_variable_any cv_not_empty_;
};

} // namespace chunkingest
