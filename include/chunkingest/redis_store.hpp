#pragma once
#include "dedup_store.hpp"
#include "session_tracker.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sw {
namespace redis {
class Redis;
} // namespace redis
} // namespace sw

namespace chunkingest {

struct RedisConfig {
  std::string redis_host{"127.0.0.1"};
  int redis_port{6379};
  std::string redis_prefix{"chunkingest"};
  std::size_t pool_size{8};
  int socket_timeout_ms{2000};
};

// Подключение с проверкой ping; StorageError, если Redis недоступен
std::shared_ptr<sw::redis::Redis> connect_redis(const RedisConfig &cfg);

// Экранирование частей ключа: '%' и ':' → %25 / %3A
std::string escape_key_part(const std::string &s);

// SET key value NX — уникальность обеспечивает сам Redis
class RedisDedupStore : public DedupStore {
public:
  RedisDedupStore(std::shared_ptr<sw::redis::Redis> redis, std::string prefix);
  ~RedisDedupStore() override;

  InsertOutcome insert_if_absent(const MetricRecord &record) override;
  std::size_t count(const std::string &identity,
                    const std::string &idempotency_key) override;
  // SMEMBERS индекса, затем MGET самих записей
  std::vector<MetricRecord>
  records(const std::string &identity,
          const std::string &idempotency_key) override;

  std::string record_key(const MetricRecord &r) const;

private:
  std::string index_key(const std::string &identity,
                        const std::string &idempotency_key) const;

  std::shared_ptr<sw::redis::Redis> redis_;
  std::string prefix_;
};

// Хэш на сессию (status, next_expected_seq, время) и отдельное множество
// принятых seq. Обновление через WATCH/MULTI/EXEC; update() читает только
// хэш, поэтому в возвращённой сессии committed_seqs содержит лишь новые seq.
// Полное множество отдаёт load().
class RedisSessionStore : public SessionStore {
public:
  RedisSessionStore(std::shared_ptr<sw::redis::Redis> redis, std::string prefix,
                    int max_watch_retries = 16);
  ~RedisSessionStore() override;

  std::optional<IngestSession> load(const SessionKey &key) override;
  IngestSession update(const SessionKey &key, const Mutator &fn) override;

  std::string session_key(const SessionKey &key) const;
  std::string seqs_key(const SessionKey &key) const;

private:
  std::shared_ptr<sw::redis::Redis> redis_;
  std::string prefix_;
  int max_watch_retries_;
};

// Значение ключа записи: JSON с publisher, seq, offset, body
std::string encode_record(const MetricRecord &r);
MetricRecord decode_record(const std::string &value);

// Сериализация сессии в поля хэша и обратно, без committed_seqs
std::map<std::string, std::string> encode_session(const IngestSession &s);
IngestSession decode_session(const std::map<std::string, std::string> &h);

// Что сделать с множеством seq после перехода. cur прочитан без множества,
// поэтому всё, что есть в next.committed_seqs, добавлено этим переходом.
struct SeqsDelta {
  bool reset{false};
  std::vector<std::int64_t> added;
};
SeqsDelta seqs_delta(const std::optional<IngestSession> &cur,
                     const IngestSession &next);

} // namespace chunkingest
