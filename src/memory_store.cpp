#include "chunkingest/memory_store.hpp"
#include <limits>

namespace chunkingest {

InsertOutcome MemoryDedupStore::insert_if_absent(const MetricRecord &r) {
  boost::lock_guard<boost::mutex> lk(m_);
  auto res = records_.emplace(
      Key{r.identity, r.idempotency_key, r.seq, r.offset}, r);
  return res.second ? InsertOutcome::inserted : InsertOutcome::already_present;
}

std::size_t MemoryDedupStore::count(const std::string &identity,
                                    const std::string &idempotency_key) {
  return records(identity, idempotency_key).size();
}

std::vector<MetricRecord>
MemoryDedupStore::records(const std::string &identity,
                          const std::string &idempotency_key) {
  boost::lock_guard<boost::mutex> lk(m_);
  std::vector<MetricRecord> out;
  const Key lo{identity, idempotency_key,
               std::numeric_limits<std::int64_t>::min(),
               std::numeric_limits<std::int64_t>::min()};
  for (auto it = records_.lower_bound(lo); it != records_.end(); ++it) {
    if (std::get<0>(it->first) != identity ||
        std::get<1>(it->first) != idempotency_key)
      break;
    out.push_back(it->second);
  }
  return out;
}

std::size_t MemoryDedupStore::size() const {
  boost::lock_guard<boost::mutex> lk(m_);
  return records_.size();
}

std::optional<IngestSession> MemorySessionStore::load(const SessionKey &key) {
  boost::lock_guard<boost::mutex> lk(m_);
  auto it = sessions_.find({key.identity, key.idempotency_key});
  if (it == sessions_.end())
    return std::nullopt;
  return it->second;
}

IngestSession MemorySessionStore::update(const SessionKey &key,
                                         const Mutator &fn) {
  boost::lock_guard<boost::mutex> lk(m_);
  const auto k = std::make_pair(key.identity, key.idempotency_key);
  auto it = sessions_.find(k);
  std::optional<IngestSession> cur;
  if (it != sessions_.end())
    cur = it->second;
  IngestSession next = fn(cur); // исключение — ничего не пишем
  sessions_[k] = next;
  return next;
}

} // namespace chunkingest
