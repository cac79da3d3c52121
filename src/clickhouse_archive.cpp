#include "chunkingest/clickhouse_archive.hpp"
#include "chunkingest/log.hpp"
#include "chunkingest/time_utils.hpp"
#include <chrono>
#include <clickhouse/client.h>
#include <ctime>
#include <exception>
#include <nlohmann/json.hpp>
#include <thread>

using namespace clickhouse;

namespace chunkingest {

namespace {

constexpr std::size_t kBatchSize = 1000;

inline void sleep_with_checks(std::atomic<bool> &running,
                              std::chrono::milliseconds dur) {
  const auto step = std::chrono::milliseconds(100);
  auto left = dur;
  while (running && left.count() > 0) {
    std::this_thread::sleep_for(std::min(step, left));
    left -= step;
  }
}

// Числовое поле "ts" тела (сек/мс/мкс) или время приёма
std::time_t record_time(const MetricRecord &r, std::time_t fallback) {
  auto j = nlohmann::json::parse(r.body, nullptr, false);
  if (j.is_object() && j.contains("ts") && j["ts"].is_number_integer())
    return to_time_t_seconds(j["ts"].get<std::int64_t>());
  return fallback;
}

} // namespace

void fill_archive_block(const std::vector<MetricRecord> &records,
                        Block &block) {
  auto col_pub = std::make_shared<ColumnString>();
  auto col_key = std::make_shared<ColumnString>();
  auto col_seq = std::make_shared<ColumnInt64>();
  auto col_off = std::make_shared<ColumnInt64>();
  auto col_ts = std::make_shared<ColumnDateTime>(); // секунды (UTC)
  auto col_recv = std::make_shared<ColumnString>();
  auto col_body = std::make_shared<ColumnString>();

  const std::time_t now = std::time(nullptr);
  for (const auto &r : records) {
    col_pub->Append(r.identity);
    col_key->Append(r.idempotency_key);
    col_seq->Append(r.seq);
    col_off->Append(r.offset);
    col_ts->Append(record_time(r, now));
    col_recv->Append(r.received_at);
    col_body->Append(r.body);
  }

  block.AppendColumn("publisher", col_pub);
  block.AppendColumn("idempotency_key", col_key);
  block.AppendColumn("seq", col_seq);
  block.AppendColumn("rec_offset", col_off);
  block.AppendColumn("ts", col_ts);
  block.AppendColumn("received_at", col_recv);
  block.AppendColumn("body", col_body);
}

std::string archive_table_ddl(const std::string &table) {
  return "CREATE TABLE IF NOT EXISTS " + table +
         " (publisher String, idempotency_key String, seq Int64,"
         " rec_offset Int64, ts DateTime, received_at String, body String)"
         " ENGINE = ReplacingMergeTree"
         " ORDER BY (publisher, idempotency_key, seq, rec_offset)";
}

ClickHouseArchive::ClickHouseArchive(const Config &cfg)
    : cfg_(cfg), queue_(cfg.archive_queue_capacity) {}

ClickHouseArchive::~ClickHouseArchive() { stop(); }

void ClickHouseArchive::start() {
  if (running_.exchange(true))
    return;
  if (cfg_.ch_port < 0 || cfg_.ch_port > 65535) {
    throw std::runtime_error("ClickHouse port is out of range (0..65535)");
  }
  worker_ = std::make_unique<boost::thread>([this] {
    try {
      worker_loop();
    } catch (const std::exception &e) {
      log::error("CH", std::string("archive worker fatal: ") + e.what());
    }
  });
}

void ClickHouseArchive::stop() {
  if (!running_.exchange(false))
    return;
  queue_.stop();
  if (worker_ && worker_->joinable())
    worker_->join();
  worker_.reset();
  if (dropped_ > 0)
    log::warn("CH", "archive dropped " + std::to_string(dropped_.load()) +
                        " rows (queue full)");
}

bool ClickHouseArchive::enqueue(const MetricRecord &record) {
  if (queue_.try_push(record))
    return true;
  if (dropped_.fetch_add(1) % 10000 == 0)
    log::error("CH", "archive queue full, dropping rows");
  return false;
}

void ClickHouseArchive::worker_loop() {
  const std::chrono::milliseconds connect_retry_delay(3000);
  // пачка переживает переподключение
  std::vector<MetricRecord> pending;

  while (running_ || !pending.empty()) {
    try {
      ClientOptions opts;
      opts.SetHost(cfg_.ch_host)
          .SetPort(static_cast<uint16_t>(cfg_.ch_port))
          .SetDefaultDatabase(cfg_.ch_database);

      if (!cfg_.ch_user.empty())
        opts.SetUser(cfg_.ch_user);
      if (!cfg_.ch_password.empty())
        opts.SetPassword(cfg_.ch_password);

      Client client(opts);
      client.Execute(archive_table_ddl(cfg_.ch_table));
      log::info("CH", "connected: host=" + cfg_.ch_host +
                          " port=" + std::to_string(cfg_.ch_port) +
                          " db=" + cfg_.ch_database);

      while (true) {
        if (pending.empty()) {
          auto first = queue_.pop();
          if (!first.has_value())
            return; // остановлены, очередь пуста
          pending.push_back(std::move(*first));
          while (pending.size() < kBatchSize) {
            auto more = queue_.try_pop();
            if (!more.has_value())
              break;
            pending.push_back(std::move(*more));
          }
        }

        Block block;
        fill_archive_block(pending, block);
        client.Insert(cfg_.ch_table, block);
        log::debug("CH", "archived " + std::to_string(pending.size()) +
                             " rows");
        pending.clear();
      }
    } catch (const std::exception &e) {
      log::error("CH", std::string("connection/loop error: ") + e.what() +
                           " (host=" + cfg_.ch_host +
                           " port=" + std::to_string(cfg_.ch_port) +
                           ") retry in " +
                           std::to_string(connect_retry_delay.count()) + "ms");
      if (!running_) {
        log::error("CH", "shutting down with " +
                             std::to_string(pending.size()) +
                             " unarchived rows");
        return;
      }
      sleep_with_checks(running_, connect_retry_delay);
    }
  }
}

} // namespace chunkingest
