#include "chunkingest/redis_store.hpp"
#include "chunkingest/errors.hpp"
#include "chunkingest/log.hpp"
#include <algorithm>
#include <chrono>
#include <iterator>
#include <nlohmann/json.hpp>
#include <sstream>
#include <tuple>
#include <sw/redis++/redis++.h>

namespace chunkingest {

using sw::redis::Redis;
using json = nlohmann::json;

std::shared_ptr<Redis> connect_redis(const RedisConfig &cfg) {
  try {
    sw::redis::ConnectionOptions opts;
    opts.host = cfg.redis_host;
    opts.port = cfg.redis_port;
    opts.socket_timeout = std::chrono::milliseconds(cfg.socket_timeout_ms);

    sw::redis::ConnectionPoolOptions pool;
    pool.size = cfg.pool_size ? cfg.pool_size : 1;

    auto redis = std::make_shared<Redis>(opts, pool);
    redis->ping(); // проверяем, что соединение живое
    log::info("REDIS", "connected: " + cfg.redis_host + ":" +
                           std::to_string(cfg.redis_port));
    return redis;
  } catch (const sw::redis::Error &e) {
    throw StorageError(std::string("redis connect failed: ") + e.what());
  }
}

std::string escape_key_part(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '%')
      out += "%25";
    else if (c == ':')
      out += "%3A";
    else
      out += c;
  }
  return out;
}

// ---------------------------------------------------------------- records

RedisDedupStore::RedisDedupStore(std::shared_ptr<Redis> redis,
                                 std::string prefix)
    : redis_(std::move(redis)), prefix_(std::move(prefix)) {}

RedisDedupStore::~RedisDedupStore() = default;

std::string RedisDedupStore::record_key(const MetricRecord &r) const {
  std::ostringstream k;
  k << prefix_ << ":record:" << escape_key_part(r.identity) << ':'
    << escape_key_part(r.idempotency_key) << ':' << r.seq << ':' << r.offset;
  return k.str();
}

std::string RedisDedupStore::index_key(const std::string &identity,
                                       const std::string &idem) const {
  return prefix_ + ":records:" + escape_key_part(identity) + ":" +
         escape_key_part(idem);
}

std::string encode_record(const MetricRecord &r) {
  const json doc = {{"publisher", r.identity},
                    {"idempotency_key", r.idempotency_key},
                    {"seq", r.seq},
                    {"offset", r.offset},
                    {"received_at", r.received_at},
                    {"body", r.body}};
  return doc.dump();
}

MetricRecord decode_record(const std::string &value) {
  MetricRecord r;
  try {
    const auto doc = json::parse(value);
    r.identity = doc.at("publisher").get<std::string>();
    r.idempotency_key = doc.at("idempotency_key").get<std::string>();
    r.seq = doc.at("seq").get<std::int64_t>();
    r.offset = doc.at("offset").get<std::int64_t>();
    r.received_at = doc.value("received_at", std::string{});
    r.body = doc.at("body").get<std::string>();
  } catch (const json::exception &e) {
    throw StorageError(std::string("corrupt record value: ") + e.what());
  }
  return r;
}

InsertOutcome RedisDedupStore::insert_if_absent(const MetricRecord &r) {
  const std::string key = record_key(r);
  try {
    const bool created = redis_->set(key, encode_record(r),
                                     std::chrono::milliseconds(0),
                                     sw::redis::UpdateType::NOT_EXIST);
    // индекс идемпотентен, поэтому пишем его и при конфликте:
    // так он догоняет после падения между SET и SADD
    redis_->sadd(index_key(r.identity, r.idempotency_key), key);
    return created ? InsertOutcome::inserted : InsertOutcome::already_present;
  } catch (const sw::redis::Error &e) {
    throw StorageError(std::string("redis SET NX failed: ") + e.what());
  }
}

std::size_t RedisDedupStore::count(const std::string &identity,
                                   const std::string &idem) {
  try {
    return static_cast<std::size_t>(redis_->scard(index_key(identity, idem)));
  } catch (const sw::redis::Error &e) {
    throw StorageError(std::string("redis SCARD failed: ") + e.what());
  }
}

std::vector<MetricRecord>
RedisDedupStore::records(const std::string &identity,
                         const std::string &idem) {
  std::vector<std::string> keys;
  std::vector<sw::redis::OptionalString> values;
  try {
    redis_->smembers(index_key(identity, idem), std::back_inserter(keys));
    if (keys.empty())
      return {};
    redis_->mget(keys.begin(), keys.end(), std::back_inserter(values));
  } catch (const sw::redis::Error &e) {
    throw StorageError(std::string("redis SMEMBERS/MGET failed: ") + e.what());
  }

  std::vector<MetricRecord> out;
  out.reserve(values.size());
  for (const auto &v : values) {
    if (v) // ключ удалён вручную, индекс устарел
      out.push_back(decode_record(*v));
  }
  std::sort(out.begin(), out.end(),
            [](const MetricRecord &a, const MetricRecord &b) {
              return std::tie(a.seq, a.offset) < std::tie(b.seq, b.offset);
            });
  return out;
}

// --------------------------------------------------------------- sessions

std::map<std::string, std::string> encode_session(const IngestSession &s) {
  return {{"status", to_string(s.status)},
          {"next_expected_seq", std::to_string(s.next_expected_seq)},
          {"created_at", s.created_at},
          {"last_update", s.last_update}};
}

IngestSession decode_session(const std::map<std::string, std::string> &h) {
  IngestSession s;
  try {
    s.status = session_status_from_string(h.at("status"));
    s.next_expected_seq = std::stoll(h.at("next_expected_seq"));
    auto it = h.find("created_at");
    if (it != h.end())
      s.created_at = it->second;
    it = h.find("last_update");
    if (it != h.end())
      s.last_update = it->second;
  } catch (const std::exception &e) {
    throw StorageError(std::string("corrupt session hash: ") + e.what());
  }
  return s;
}

SeqsDelta seqs_delta(const std::optional<IngestSession> &cur,
                     const IngestSession &next) {
  SeqsDelta d;
  // stale → in_progress: прежнее множество больше не действует
  d.reset = cur && cur->status == SessionStatus::stale &&
            next.status == SessionStatus::in_progress;
  d.added.assign(next.committed_seqs.begin(), next.committed_seqs.end());
  return d;
}

RedisSessionStore::RedisSessionStore(std::shared_ptr<Redis> redis,
                                     std::string prefix, int max_watch_retries)
    : redis_(std::move(redis)), prefix_(std::move(prefix)),
      max_watch_retries_(max_watch_retries) {}

RedisSessionStore::~RedisSessionStore() = default;

std::string RedisSessionStore::session_key(const SessionKey &key) const {
  return prefix_ + ":session:" + escape_key_part(key.identity) + ":" +
         escape_key_part(key.idempotency_key);
}

std::string RedisSessionStore::seqs_key(const SessionKey &key) const {
  return session_key(key) + ":seqs";
}

std::optional<IngestSession> RedisSessionStore::load(const SessionKey &key) {
  std::map<std::string, std::string> h;
  std::vector<std::string> seqs;
  try {
    redis_->hgetall(session_key(key), std::inserter(h, h.end()));
    if (h.empty())
      return std::nullopt;
    redis_->smembers(seqs_key(key), std::back_inserter(seqs));
  } catch (const sw::redis::Error &e) {
    throw StorageError(std::string("redis session load failed: ") + e.what());
  }
  auto s = decode_session(h);
  try {
    for (const auto &v : seqs)
      s.committed_seqs.insert(std::stoll(v));
  } catch (const std::exception &e) {
    throw StorageError(std::string("corrupt session seqs: ") + e.what());
  }
  return s;
}

IngestSession RedisSessionStore::update(const SessionKey &key,
                                        const Mutator &fn) {
  const std::string k = session_key(key);
  const std::string sk = seqs_key(key);
  try {
    auto tx = redis_->transaction();
    auto r = tx.redis(); // то же соединение, нужно для WATCH
    for (int attempt = 0; attempt < max_watch_retries_; ++attempt) {
      try {
        // множество seq меняется только вместе с хэшем, хватает WATCH хэша
        r.watch(k);
        std::map<std::string, std::string> h;
        r.hgetall(k, std::inserter(h, h.end()));
        std::optional<IngestSession> cur;
        if (!h.empty())
          cur = decode_session(h);

        IngestSession next;
        try {
          next = fn(cur);
        } catch (const InvalidTransition &) {
          r.unwatch(); // соединение вернётся в пул без WATCH
          throw;
        }
        const auto fields = encode_session(next);
        const auto delta = seqs_delta(cur, next);
        std::vector<std::string> added;
        for (auto v : delta.added)
          added.push_back(std::to_string(v));

        tx.hmset(k, fields.begin(), fields.end());
        if (delta.reset)
          tx.del(sk);
        if (!added.empty())
          tx.sadd(sk, added.begin(), added.end());
        tx.exec();
        return next;
      } catch (const sw::redis::WatchError &) {
        log::debug("REDIS", "session " + k + " changed concurrently, retry");
      }
    }
  } catch (const sw::redis::Error &e) {
    throw StorageError(std::string("redis session update failed: ") +
                       e.what());
  }
  throw StorageError("session " + k + " is too contended");
}

} // namespace chunkingest
