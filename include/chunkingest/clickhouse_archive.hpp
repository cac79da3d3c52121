#pragma once
#include "dedup_store.hpp"
#include "threadsafe_queue.hpp"
#include "types.hpp"
#include <atomic>
#include <boost/thread.hpp>
#include <memory>
#include <vector>

namespace clickhouse {
class Block;
} // namespace clickhouse

namespace chunkingest {

// Аналитическое зеркало в ClickHouse: только впервые вставленные записи.
// Источник истины — DedupStore; таблица ReplacingMergeTree
// схлопывает повторы после переподключения.
class ClickHouseArchive {
public:
  explicit ClickHouseArchive(const Config &cfg);
  ~ClickHouseArchive();

  void start();
  void stop();

  // Не блокирует. false — очередь полна, запись в архив не попадёт
  bool enqueue(const MetricRecord &record);

private:
  void worker_loop();

  const Config cfg_;
  ThreadSafeQueue<MetricRecord> queue_;
  std::unique_ptr<boost::thread> worker_;
  std::atomic<bool> running_{false};
  std::atomic<unsigned long long> dropped_{0};
};

// Колонки: publisher, idempotency_key, seq, rec_offset, ts, received_at, body
void fill_archive_block(const std::vector<MetricRecord> &records,
                        clickhouse::Block &block);

std::string archive_table_ddl(const std::string &table);

} // namespace chunkingest
