#pragma once
#include "codec.hpp"
#include "dedup_store.hpp"
#include "session_tracker.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace chunkingest {

struct IngestLimits {
  std::size_t max_record_bytes = 16 * 1024 * 1024; // лимит документа
  std::size_t max_chunk_records = 10'000;
};

struct ChunkRequest {
  std::string identity;
  std::string idempotency_key;
  std::int64_t seq{0};
  std::vector<RecordJson> records;
};

struct ChunkOutcome {
  std::size_t inserted{0};
  std::size_t already_present{0};
  // true, только если все записи чанка уже были сохранены
  bool duplicate{false};
  std::int64_t next_expected_seq{0};
  SessionStatus status{SessionStatus::in_progress};
};

// Получает только впервые вставленные записи (архив и т.п.)
using RecordSink = std::function<void(const MetricRecord &)>;

class IngestService {
public:
  using Clock = std::function<std::string()>;

  IngestService(DedupStore &store, SessionTracker &tracker,
                IngestLimits limits = {});
  IngestService(DedupStore &store, SessionTracker &tracker,
                IngestLimits limits, Clock clock);

  void set_record_sink(RecordSink sink) { sink_ = std::move(sink); }

  // Запись чанка с дедупликацией по (identity, key, seq, offset).
  // Все проверки выполняются до первой записи: ValidationError,
  // SizeLimitExceeded, AuthError. StorageError — хранилище недоступно.
  ChunkOutcome commit_chunk(const ChunkRequest &req);

  SessionTracker &tracker() { return tracker_; }
  DedupStore &store() { return store_; }
  const IngestLimits &limits() const { return limits_; }

private:
  std::vector<std::string> serialize_checked(const ChunkRequest &req) const;

  DedupStore &store_;
  SessionTracker &tracker_;
  IngestLimits limits_;
  Clock clock_;
  RecordSink sink_;
};

} // namespace chunkingest
