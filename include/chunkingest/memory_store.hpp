#pragma once
#include "dedup_store.hpp"
#include "session_tracker.hpp"
#include <boost/thread.hpp>
#include <map>
#include <tuple>
#include <vector>

namespace chunkingest {

// Хранилища в памяти процесса: dev-режим и тесты
class MemoryDedupStore : public DedupStore {
public:
  InsertOutcome insert_if_absent(const MetricRecord &record) override;
  std::size_t count(const std::string &identity,
                    const std::string &idempotency_key) override;
  std::vector<MetricRecord>
  records(const std::string &identity,
          const std::string &idempotency_key) override;

  std::size_t size() const;

private:
  using Key = std::tuple<std::string, std::string, std::int64_t, std::int64_t>;

  mutable boost::mutex m_;
  std::map<Key, MetricRecord> records_;
};

class MemorySessionStore : public SessionStore {
public:
  std::optional<IngestSession> load(const SessionKey &key) override;
  IngestSession update(const SessionKey &key, const Mutator &fn) override;

private:
  boost::mutex m_;
  std::map<std::pair<std::string, std::string>, IngestSession> sessions_;
};

} // namespace chunkingest
