#include "chunkingest/ingest_service.hpp"
#include "chunkingest/errors.hpp"
#include "chunkingest/log.hpp"
#include "chunkingest/metrics_export.hpp"
#include "chunkingest/time_utils.hpp"

namespace chunkingest {

IngestService::IngestService(DedupStore &store, SessionTracker &tracker,
                             IngestLimits limits)
    : IngestService(store, tracker, limits, [] { return utc_now_iso(); }) {}

IngestService::IngestService(DedupStore &store, SessionTracker &tracker,
                             IngestLimits limits, Clock clock)
    : store_(store), tracker_(tracker), limits_(limits),
      clock_(std::move(clock)) {}

std::vector<std::string>
IngestService::serialize_checked(const ChunkRequest &req) const {
  if (req.identity.empty())
    throw AuthError(401, "publisher identity is not resolved");
  if (req.idempotency_key.empty())
    throw ValidationError(400, "Idempotency-Key must not be empty");
  if (req.seq < 0)
    throw ValidationError(400, "seq must be a non-negative integer");
  if (req.records.size() > limits_.max_chunk_records)
    throw SizeLimitExceeded("chunk has " + std::to_string(req.records.size()) +
                            " records, limit is " +
                            std::to_string(limits_.max_chunk_records));

  std::vector<std::string> bodies;
  bodies.reserve(req.records.size());
  for (std::size_t i = 0; i < req.records.size(); ++i) {
    bodies.push_back(req.records[i].dump());
    if (bodies.back().size() > limits_.max_record_bytes)
      throw SizeLimitExceeded("record " + std::to_string(i) + " is " +
                              std::to_string(bodies.back().size()) +
                              " bytes, limit is " +
                              std::to_string(limits_.max_record_bytes));
  }
  return bodies;
}

ChunkOutcome IngestService::commit_chunk(const ChunkRequest &req) {
  const auto bodies = serialize_checked(req);
  const SessionKey key{req.identity, req.idempotency_key};
  const std::string now = clock_();

  const auto opened = tracker_.open(key);
  if (opened.status == SessionStatus::complete) {
    log::warn("INGEST", "chunk seq=" + std::to_string(req.seq) +
                            " for complete session " + req.identity + "/" +
                            req.idempotency_key);
  }

  ChunkOutcome out;
  try {
    for (std::size_t i = 0; i < bodies.size(); ++i) {
      MetricRecord rec;
      rec.identity = req.identity;
      rec.idempotency_key = req.idempotency_key;
      rec.seq = req.seq;
      rec.offset = static_cast<std::int64_t>(i);
      rec.body = bodies[i];
      rec.received_at = now;

      if (store_.insert_if_absent(rec) == InsertOutcome::inserted) {
        ++out.inserted;
        if (sink_)
          sink_(rec);
      } else {
        ++out.already_present;
      }
    }
  } catch (const StorageError &e) {
    // часть записей уже долговечна — high-water mark обязан это отразить
    if (out.inserted + out.already_present > 0) {
      try {
        tracker_.record_chunk(key, req.seq);
      } catch (const StorageError &e2) {
        log::error("INGEST", std::string("session update after partial "
                                         "commit failed: ") +
                                 e2.what());
      }
    }
    g_records_inserted.fetch_add(out.inserted, std::memory_order_relaxed);
    log::error("INGEST", "seq=" + std::to_string(req.seq) + " stopped after " +
                             std::to_string(out.inserted) +
                             " inserts: " + e.what());
    throw;
  }

  const auto session = tracker_.record_chunk(key, req.seq);
  out.duplicate = !bodies.empty() && out.inserted == 0;
  out.next_expected_seq = session.next_expected_seq;
  out.status = session.status;

  g_records_inserted.fetch_add(out.inserted, std::memory_order_relaxed);
  g_records_duplicate.fetch_add(out.already_present, std::memory_order_relaxed);
  log::debug("INGEST", req.identity + "/" + req.idempotency_key +
                           " seq=" + std::to_string(req.seq) +
                           " inserted=" + std::to_string(out.inserted) +
                           " present=" + std::to_string(out.already_present));
  return out;
}

} // namespace chunkingest
