#include "chunkingest/session_tracker.hpp"
#include "chunkingest/errors.hpp"
#include "chunkingest/log.hpp"
#include "chunkingest/time_utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace chunkingest {

const char *to_string(SessionStatus s) {
  switch (s) {
  case SessionStatus::in_progress:
    return "in_progress";
  case SessionStatus::complete:
    return "complete";
  case SessionStatus::stale:
    return "stale";
  }
  return "unknown";
}

SessionStatus session_status_from_string(const std::string &s) {
  if (s == "in_progress")
    return SessionStatus::in_progress;
  if (s == "complete")
    return SessionStatus::complete;
  if (s == "stale")
    return SessionStatus::stale;
  throw std::invalid_argument("unknown session status: " + s);
}

namespace {

IngestSession fresh(const std::string &now) {
  IngestSession s;
  s.status = SessionStatus::in_progress;
  s.next_expected_seq = 0;
  s.created_at = now;
  s.last_update = now;
  return s;
}

// stale: прежний прогресс не доверяем, записи не трогаем
IngestSession restart(const IngestSession &prev, const std::string &now) {
  IngestSession s = prev;
  s.status = SessionStatus::in_progress;
  s.next_expected_seq = 0;
  s.committed_seqs.clear();
  s.last_update = now;
  return s;
}

} // namespace

IngestSession apply_event(const std::optional<IngestSession> &current,
                          const SessionEvent &ev, const std::string &now) {
  switch (ev.kind) {
  case SessionEvent::Kind::open: {
    if (!current)
      return fresh(now);
    if (current->status == SessionStatus::stale)
      return restart(*current, now);
    return *current;
  }
  case SessionEvent::Kind::chunk_committed: {
    if (ev.seq < 0)
      throw InvalidTransition("negative seq");
    IngestSession s = !current ? fresh(now)
                      : current->status == SessionStatus::stale
                          ? restart(*current, now)
                          : *current;
    s.next_expected_seq = std::max(s.next_expected_seq, ev.seq + 1);
    s.committed_seqs.insert(ev.seq);
    s.last_update = now;
    return s;
  }
  case SessionEvent::Kind::finalize: {
    if (!current)
      throw InvalidTransition("finalize: no such session");
    if (current->status == SessionStatus::stale)
      throw InvalidTransition("finalize: session is stale");
    IngestSession s = *current;
    if (s.status == SessionStatus::in_progress) {
      s.status = SessionStatus::complete;
      s.last_update = now;
    }
    return s;
  }
  case SessionEvent::Kind::mark_stale: {
    if (!current)
      throw InvalidTransition("mark_stale: no such session");
    if (current->status == SessionStatus::complete)
      throw InvalidTransition("mark_stale: session is complete");
    IngestSession s = *current;
    if (s.status == SessionStatus::in_progress) {
      s.status = SessionStatus::stale;
      s.last_update = now;
    }
    return s;
  }
  }
  throw InvalidTransition("unknown session event");
}

SessionTracker::SessionTracker(SessionStore &store)
    : SessionTracker(store, [] { return utc_now_iso(); }) {}

SessionTracker::SessionTracker(SessionStore &store, Clock clock)
    : store_(store), clock_(std::move(clock)) {}

IngestSession SessionTracker::apply(const SessionKey &key,
                                    const SessionEvent &ev) {
  const std::string now = clock_();
  return store_.update(key, [&](const std::optional<IngestSession> &cur) {
    return apply_event(cur, ev, now);
  });
}

IngestSession SessionTracker::open(const SessionKey &key) {
  auto s = apply(key, SessionEvent::open());
  log::debug("SESS", "open " + key.identity + "/" + key.idempotency_key +
                         " status=" + to_string(s.status));
  return s;
}

IngestSession SessionTracker::record_chunk(const SessionKey &key,
                                           std::int64_t seq) {
  return apply(key, SessionEvent::chunk_committed(seq));
}

IngestSession SessionTracker::finalize(const SessionKey &key) {
  auto s = apply(key, SessionEvent::finalize());
  log::info("SESS", "finalized " + key.identity + "/" + key.idempotency_key);
  return s;
}

IngestSession SessionTracker::mark_stale(const SessionKey &key) {
  auto s = apply(key, SessionEvent::mark_stale());
  log::info("SESS", "marked stale " + key.identity + "/" + key.idempotency_key);
  return s;
}

std::optional<IngestSession> SessionTracker::status(const SessionKey &key) {
  return store_.load(key);
}

std::vector<std::int64_t> missing_seqs(const IngestSession &s,
                                       std::size_t limit) {
  std::vector<std::int64_t> out;
  if (s.committed_seqs.empty())
    return out;
  const std::int64_t top = *s.committed_seqs.rbegin();
  for (std::int64_t i = 0; i < top && out.size() < limit; ++i) {
    if (!s.committed_seqs.count(i))
      out.push_back(i);
  }
  return out;
}

} // namespace chunkingest
