#pragma once
#include "manifest.hpp"
#include "retry.hpp"
#include "transport.hpp"
#include "upload_state.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chunkingest {

struct UploadOptions {
  std::string endpoint;          // POST .../submit/ndjson
  std::string status_endpoint;   // GET .../ingest/status
  std::string finalize_endpoint; // POST .../ingest/finalize, пусто — не слать
  std::string bearer;
  std::optional<std::int64_t> resume_from;
  bool auto_resume = false;
  bool resume_local = true;
  RetryPolicy retry;
  std::chrono::milliseconds timeout{30'000};
};

// Ответ /ingest/status
struct ServerProgress {
  std::string status; // in_progress | complete | stale | none
  std::int64_t next_expected_seq{0};
};

// Точка возобновления. Приоритет: сервер, затем resume_from и локальный
// журнал, затем start_seq; результат не меньше start_seq.
std::int64_t resolve_resume_point(std::int64_t start_seq,
                                  std::optional<std::int64_t> resume_from,
                                  const std::optional<ServerProgress> &server,
                                  std::optional<std::int64_t> local_last_acked);

struct UploadReport {
  std::int64_t resume_point{0};
  std::size_t chunks_sent{0};
  std::size_t chunks_duplicate{0};
  std::size_t chunks_skipped{0};
  std::size_t records_inserted{0};
  bool cancelled{false};
  bool finalized{false};
};

// Отправляет чанки манифеста по одному в порядке seq.
// Повторяемые сбои (сеть, таймаут, 408/429/5xx) — с backoff до max_attempts,
// остальные 4xx — сразу UploadAborted с seq чанка.
class UploadOrchestrator {
public:
  using Clock = std::function<std::string()>;

  UploadOrchestrator(Manifest manifest, std::filesystem::path dir,
                     HttpTransport &transport, UploadOptions opts);

  // cancel проверяется только между чанками
  UploadReport run(const std::atomic<bool> *cancel = nullptr);

  std::optional<ServerProgress> query_status();

  void set_sleeper(Backoff::Sleeper s) { backoff_.set_sleeper(std::move(s)); }
  void set_clock(Clock c) { clock_ = std::move(c); }

  const UploadState &state() const { return state_; }
  const Manifest &manifest() const { return manifest_; }

private:
  HttpResponse send_with_retry(std::int64_t seq, const std::string &what,
                               const std::function<HttpResponse()> &call);
  void send_chunk(const ChunkInfo &c, UploadReport &rep);
  void finalize(UploadReport &rep);
  std::string read_verified(const ChunkInfo &c) const;
  void load_state();
  void persist();
  HeaderList auth_headers() const;

  Manifest manifest_;
  std::filesystem::path dir_;
  HttpTransport &transport_;
  UploadOptions opts_;
  Backoff backoff_;
  Clock clock_;
  UploadState state_;
  ProgressLog progress_;
};

// Минимальное shell-экранирование для показа команд
std::string shell_quote(const std::string &s);

// Команды curl для чанков с seq >= from_seq (режим "только план")
std::vector<std::string> curl_commands(const Manifest &m,
                                       const std::filesystem::path &dir,
                                       const UploadOptions &opts,
                                       std::int64_t from_seq);

} // namespace chunkingest
