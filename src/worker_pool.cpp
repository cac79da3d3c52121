#include "chunkingest/worker_pool.hpp"
#include "chunkingest/log.hpp"
#include "chunkingest/metrics_export.hpp"
#include <exception>
#include <string>

namespace chunkingest {

bool submit_task(ThreadSafeQueue<EnqueuedTask> &queue, EnqueuedTask task) {
  g_queue_size.fetch_add(1ULL, std::memory_order_relaxed);
  if (queue.try_push(std::move(task)))
    return true;
  g_queue_size.fetch_sub(1ULL, std::memory_order_relaxed);
  return false;
}

WorkerPool::WorkerPool(std::size_t threads, ThreadSafeQueue<EnqueuedTask> &q)
    : threads_(threads ? threads : 1), queue_(q) {}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  if (running_.exchange(true))
    return;

  workers_.reserve(threads_);
  for (std::size_t i = 0; i < threads_; ++i) {
    workers_.emplace_back(std::make_unique<boost::thread>([this] {
      try {
        worker_loop();
      } catch (const std::exception &e) {
        log::error("WORK", std::string("worker fatal: ") + e.what());
      }
    }));
  }
  log::info("WORK", "started " + std::to_string(threads_) + " workers");
}

void WorkerPool::stop() {
  if (!running_.exchange(false))
    return;

  queue_.stop();

  for (auto &w : workers_) {
    if (w && w->joinable())
      w->join();
  }
  workers_.clear();
}

void WorkerPool::worker_loop() {
  while (running_) {
    auto item_opt = queue_.pop();
    if (!item_opt.has_value())
      break; // очередь остановлена и пуста

    // элемент извлечён из очереди → уменьшаем gauge
    g_queue_size.fetch_sub(1ULL, std::memory_order_relaxed);

    auto &t = *item_opt;
    HttpReply r;
    try {
      r = t.work();
    } catch (const std::exception &ex) {
      log::error("WORK", "request " + t.request_id + ": " + ex.what());
      r = {500, std::string(R"({"error":"internal error","msg":")") +
                    "unhandled worker exception\"}"};
    }
    if (t.reply && t.reply->respond) {
      t.reply->respond(std::move(r));
    }
  }
}

} // namespace chunkingest
