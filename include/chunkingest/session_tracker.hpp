#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chunkingest {

enum class SessionStatus { in_progress, complete, stale };

const char *to_string(SessionStatus s);
// Бросает std::invalid_argument на неизвестном значении
SessionStatus session_status_from_string(const std::string &s);

struct SessionKey {
  std::string identity;
  std::string idempotency_key;
};

struct IngestSession {
  SessionStatus status{SessionStatus::in_progress};
  // max(seq) + 1 среди принятых чанков, пропуски допускаются
  std::int64_t next_expected_seq{0};
  std::string created_at;
  std::string last_update;
  std::set<std::int64_t> committed_seqs;
};

struct SessionEvent {
  enum class Kind { open, chunk_committed, finalize, mark_stale };
  Kind kind;
  std::int64_t seq{0};

  static SessionEvent open() { return {Kind::open, 0}; }
  static SessionEvent chunk_committed(std::int64_t seq) {
    return {Kind::chunk_committed, seq};
  }
  static SessionEvent finalize() { return {Kind::finalize, 0}; }
  static SessionEvent mark_stale() { return {Kind::mark_stale, 0}; }
};

// Функция переходов. current == nullopt — сессии ещё нет.
// Недопустимый переход — InvalidTransition.
IngestSession apply_event(const std::optional<IngestSession> &current,
                          const SessionEvent &ev, const std::string &now);

// Персистентность сессий. update() обязан быть атомарным
// "прочитать → применить → записать" для одного ключа.
class SessionStore {
public:
  using Mutator =
      std::function<IngestSession(const std::optional<IngestSession> &)>;

  virtual ~SessionStore() = default;

  virtual std::optional<IngestSession> load(const SessionKey &key) = 0;
  virtual IngestSession update(const SessionKey &key, const Mutator &fn) = 0;
};

// Единственный владелец переходов состояния сессии
class SessionTracker {
public:
  using Clock = std::function<std::string()>;

  explicit SessionTracker(SessionStore &store);
  SessionTracker(SessionStore &store, Clock clock);

  // Находит или создаёт сессию перед записью чанка (stale → in_progress)
  IngestSession open(const SessionKey &key);
  IngestSession record_chunk(const SessionKey &key, std::int64_t seq);
  IngestSession finalize(const SessionKey &key);
  IngestSession mark_stale(const SessionKey &key);

  std::optional<IngestSession> status(const SessionKey &key);

private:
  IngestSession apply(const SessionKey &key, const SessionEvent &ev);

  SessionStore &store_;
  Clock clock_;
};

// Пропуски в [0, max(committed)] — для диагностики, не более limit штук
std::vector<std::int64_t> missing_seqs(const IngestSession &s,
                                       std::size_t limit = 1000);

} // namespace chunkingest
