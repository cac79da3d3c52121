#pragma once
#include "request_context.hpp"
#include "threadsafe_queue.hpp"
#include <atomic>
#include <boost/thread.hpp>
#include <memory>
#include <vector>

namespace chunkingest {

// Выполняет работу запросов (доступ к хранилищам) вне IO-потоков
class WorkerPool {
public:
  WorkerPool(std::size_t threads, ThreadSafeQueue<EnqueuedTask> &queue);
  ~WorkerPool();

  void start();
  void stop();

private:
  void worker_loop();

  const std::size_t threads_;
  ThreadSafeQueue<EnqueuedTask> &queue_;
  std::vector<std::unique_ptr<boost::thread>> workers_;
  std::atomic<bool> running_{false};
};

// Постановка в очередь с учётом g_queue_size: gauge растёт до push, иначе
// воркер может уменьшить его раньше. false — очередь полна или остановлена.
bool submit_task(ThreadSafeQueue<EnqueuedTask> &queue, EnqueuedTask task);

} // namespace chunkingest
