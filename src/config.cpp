#include "chunkingest/types.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace chunkingest {

Config load_config(const std::string &path) {
  Config c;
  std::ifstream f(path);
  if (!f)
    return c;
  json j;
  try {
    f >> j;
  } catch (const json::parse_error &e) {
    throw std::runtime_error("config " + path + ": " + e.what());
  }
  auto get = [&](auto key, auto def) {
    return j.contains(key) ? j[key].template get<std::decay_t<decltype(def)>>() : def;
  };

  c.host = get("host", c.host);
  c.port = static_cast<unsigned short>(get("port", (int)c.port));
  c.http_threads = get("http_threads", c.http_threads);
  c.worker_threads = get("worker_threads", c.worker_threads);
  c.queue_capacity = get("queue_capacity", c.queue_capacity);
  c.commit_timeout_ms = get("commit_timeout_ms", c.commit_timeout_ms);
  c.base_path = get("base_path", c.base_path);

  c.max_body_bytes = get("max_body_bytes", c.max_body_bytes);
  c.max_decoded_bytes = get("max_decoded_bytes", c.max_decoded_bytes);
  c.max_record_bytes = get("max_record_bytes", c.max_record_bytes);
  c.max_chunk_records = get("max_chunk_records", c.max_chunk_records);

  c.storage = get("storage", c.storage);
  if (c.storage != "memory" && c.storage != "redis")
    throw std::runtime_error("config: storage must be memory or redis, got " +
                             c.storage);
  c.redis_host = get("redis_host", c.redis_host);
  c.redis_port = get("redis_port", c.redis_port);
  c.redis_prefix = get("redis_prefix", c.redis_prefix);

  c.tokens = get("tokens", c.tokens);
  c.admin_tokens = get("admin_tokens", c.admin_tokens);

  c.clickhouse_enabled = get("clickhouse_enabled", c.clickhouse_enabled);
  c.ch_host = get("ch_host", c.ch_host);
  c.ch_port = get("ch_port", c.ch_port);
  c.ch_user = get("ch_user", c.ch_user);
  c.ch_password = get("ch_password", c.ch_password);
  c.ch_database = get("ch_database", c.ch_database);
  c.ch_table = get("ch_table", c.ch_table);
  c.archive_queue_capacity =
      get("archive_queue_capacity", c.archive_queue_capacity);

  c.log_file = get("log_file", c.log_file);
  c.verbose = get("verbose", c.verbose);

  return c;
}

} // namespace chunkingest
