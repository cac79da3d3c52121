#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <string>

namespace chunkingest {

struct Config {
  std::string host = "0.0.0.0";
  unsigned short port = 8080;
  std::size_t http_threads = 4;
  std::size_t worker_threads = 4;
  std::size_t queue_capacity = 10000;
  int commit_timeout_ms = 30000; // после этого 503, клиент повторит
  std::string base_path;

  // лимиты
  std::size_t max_body_bytes = 64u << 20;
  std::size_t max_decoded_bytes = 256u << 20;
  std::size_t max_record_bytes = 16u << 20;
  std::size_t max_chunk_records = 10000;

  // хранилище: "memory" | "redis"
  std::string storage = "memory";
  std::string redis_host = "127.0.0.1";
  int redis_port = 6379;
  std::string redis_prefix = "chunkingest";

  // bearer-токен → издатель
  std::map<std::string, std::string> tokens;
  std::set<std::string> admin_tokens;

  // ClickHouse (необязательный архив)
  bool clickhouse_enabled = false;
  std::string ch_host = "127.0.0.1";
  int ch_port = 9000;
  std::string ch_user = "default";
  std::string ch_password = "";
  std::string ch_database = "metrics";
  std::string ch_table = "records";
  std::size_t archive_queue_capacity = 100000;

  std::string log_file;
  bool verbose = false;
};

// Отсутствующий файл — значения по умолчанию; битый JSON — исключение
Config load_config(const std::string &path);

} // namespace chunkingest
