#include "chunkingest/upload_orchestrator.hpp"
#include "chunkingest/codec.hpp"
#include "chunkingest/errors.hpp"
#include "chunkingest/file_utils.hpp"
#include "chunkingest/log.hpp"
#include "chunkingest/time_utils.hpp"
#include <algorithm>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chunkingest {

namespace {

bool transient_status(int status) {
  return status == 408 || status == 429 || status >= 500;
}

std::string brief(const std::string &body) {
  constexpr std::size_t kMax = 200;
  return body.size() <= kMax ? body : body.substr(0, kMax) + "...";
}

// Не-2xx после исчерпания повторов — фатально
void raise_for_status(const HttpResponse &r) {
  if (r.status >= 200 && r.status < 300)
    return;
  const std::string msg = "HTTP " + std::to_string(r.status) + ": " + brief(r.body);
  if (r.status == 413)
    throw SizeLimitExceeded(msg);
  if (r.status == 401 || r.status == 403)
    throw AuthError(r.status, msg);
  throw ServerRejectError(r.status, msg);
}

} // namespace

std::int64_t resolve_resume_point(std::int64_t start_seq,
                                  std::optional<std::int64_t> resume_from,
                                  const std::optional<ServerProgress> &server,
                                  std::optional<std::int64_t> local_last_acked) {
  std::int64_t point = start_seq;
  if (server) {
    if (server->status == "stale")
      point = resume_from.value_or(start_seq);
    else
      point = std::max(server->next_expected_seq,
                       resume_from.value_or(server->next_expected_seq));
  } else if (resume_from || local_last_acked) {
    point = std::max(resume_from.value_or(start_seq),
                     local_last_acked ? *local_last_acked + 1 : start_seq);
  }
  return std::max(point, start_seq);
}

UploadOrchestrator::UploadOrchestrator(Manifest manifest,
                                       std::filesystem::path dir,
                                       HttpTransport &transport,
                                       UploadOptions opts)
    : manifest_(std::move(manifest)), dir_(std::move(dir)),
      transport_(transport), opts_(std::move(opts)), backoff_(opts_.retry),
      clock_([] { return utc_now_iso(); }),
      progress_(dir_ / kProgressLogFile) {
  state_.idempotency_key = manifest_.idempotency_key;
}

HeaderList UploadOrchestrator::auth_headers() const {
  HeaderList h;
  if (!opts_.bearer.empty())
    h.emplace_back("Authorization", "Bearer " + opts_.bearer);
  return h;
}

HttpResponse
UploadOrchestrator::send_with_retry(std::int64_t seq, const std::string &what,
                                    const std::function<HttpResponse()> &call) {
  const int max_attempts = backoff_.policy().max_attempts;
  std::string last_error;
  for (int attempt = 1;; ++attempt) {
    try {
      HttpResponse r = call();
      if (!transient_status(r.status))
        return r;
      last_error = "HTTP " + std::to_string(r.status) + ": " + brief(r.body);
    } catch (const NetworkError &e) {
      last_error = e.what();
    }
    if (attempt >= max_attempts)
      throw UploadAborted(seq, what + " failed after " + std::to_string(attempt) +
                                   " attempt(s): " + last_error);
    log::warn("UPLOAD", what + " attempt " + std::to_string(attempt) + "/" +
                            std::to_string(max_attempts) + " failed: " + last_error);
    backoff_.wait(attempt);
  }
}

std::optional<ServerProgress> UploadOrchestrator::query_status() {
  if (opts_.status_endpoint.empty())
    return std::nullopt;
  const auto url = with_query(opts_.status_endpoint, "idempotency_key",
                              manifest_.idempotency_key);
  const auto headers = auth_headers();
  const auto r = send_with_retry(manifest_.start_seq, "status query", [&] {
    return transport_.request("GET", url, headers, "", opts_.timeout);
  });
  raise_for_status(r);

  const json j = json::parse(r.body, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    throw Error("malformed status response: " + brief(r.body));
  ServerProgress p;
  try {
    p.status = j.value("status", std::string{"none"});
    p.next_expected_seq = j.value("next_expected_seq", std::int64_t{0});
  } catch (const json::type_error &e) {
    throw Error("malformed status response: " + std::string(e.what()) + ": " +
                brief(r.body));
  }
  log::info("RESUME", "server status=" + p.status +
                          " next_expected_seq=" + std::to_string(p.next_expected_seq));
  return p;
}

std::string UploadOrchestrator::read_verified(const ChunkInfo &c) const {
  std::string bytes = read_file(dir_ / c.path);
  std::string digest;
  if (c.gzip) {
    try {
      digest = md5_hex(
          gzip_decompress(bytes, std::numeric_limits<std::size_t>::max()));
    } catch (const ParseError &e) {
      throw IntegrityError(c.path + ": " + e.what());
    }
  } else {
    digest = md5_hex(bytes);
  }
  if (digest != c.md5)
    throw IntegrityError(c.path + ": md5 " + digest + " != manifest " + c.md5);
  return bytes;
}

void UploadOrchestrator::load_state() {
  const auto file = dir_ / kUploadStateFile;
  std::optional<UploadState> loaded;
  try {
    loaded = load_upload_state(file);
  } catch (const ParseError &e) {
    log::warn("RESUME", std::string("local state ignored: ") + e.what());
  }
  if (!loaded)
    return;
  if (loaded->idempotency_key != manifest_.idempotency_key) {
    log::warn("RESUME", "local state belongs to key " + loaded->idempotency_key +
                            ", ignored");
    return;
  }
  state_ = std::move(*loaded);
}

void UploadOrchestrator::persist() {
  state_.updated_at = clock_();
  save_upload_state(state_, dir_ / kUploadStateFile);
}

void UploadOrchestrator::send_chunk(const ChunkInfo &c, UploadReport &rep) {
  const std::string body = read_verified(c);

  HeaderList headers = auth_headers();
  headers.emplace_back("Content-Type", "application/x-ndjson");
  headers.emplace_back("Idempotency-Key", manifest_.idempotency_key);
  headers.emplace_back("X-Batch-Seq", std::to_string(c.seq));
  if (c.gzip)
    headers.emplace_back("Content-Encoding", "gzip");

  log::info("UPLOAD", "seq=" + std::to_string(c.seq) + " file=" + c.path);
  const auto r = send_with_retry(c.seq, "seq=" + std::to_string(c.seq), [&] {
    return transport_.request("POST", opts_.endpoint, headers, body, opts_.timeout);
  });
  raise_for_status(r);

  std::size_t inserted = 0;
  bool duplicate = false;
  const json j = json::parse(r.body, nullptr, false);
  bool parsed = !j.is_discarded() && j.is_object();
  if (parsed) {
    try {
      inserted = j.value("inserted", std::size_t{0});
      duplicate = j.value("duplicate", false);
    } catch (const json::type_error &) {
      inserted = 0;
      duplicate = false;
      parsed = false;
    }
  }
  // 2xx уже означает, что чанк принят; тело только для отчёта
  if (!parsed)
    log::warn("UPLOAD", "seq=" + std::to_string(c.seq) +
                            " accepted with unparsable body: " + brief(r.body));

  state_.mark_acked(c.seq, inserted, duplicate);
  persist();
  progress_.append(c.seq, c.path, inserted, duplicate, clock_());

  ++rep.chunks_sent;
  if (duplicate)
    ++rep.chunks_duplicate;
  rep.records_inserted += inserted;
  log::debug("UPLOAD", "seq=" + std::to_string(c.seq) + " inserted=" +
                           std::to_string(inserted) +
                           (duplicate ? " duplicate" : ""));
}

void UploadOrchestrator::finalize(UploadReport &rep) {
  const auto url = with_query(opts_.finalize_endpoint, "idempotency_key",
                              manifest_.idempotency_key);
  const auto headers = auth_headers();
  const std::int64_t last = manifest_.chunks.back().seq;
  const auto r = send_with_retry(last, "finalize", [&] {
    return transport_.request("POST", url, headers, "", opts_.timeout);
  });
  raise_for_status(r);
  rep.finalized = true;
  log::info("UPLOAD", "session finalized");
}

UploadReport UploadOrchestrator::run(const std::atomic<bool> *cancel) {
  UploadReport rep;
  rep.resume_point = manifest_.start_seq;
  if (manifest_.chunks.empty()) {
    log::info("UPLOAD", "manifest has no chunks, nothing to upload");
    return rep;
  }

  load_state();

  std::optional<ServerProgress> server;
  if (opts_.auto_resume) {
    try {
      server = query_status();
    } catch (const UploadAborted &) {
      throw;
    } catch (const Error &e) {
      throw UploadAborted(manifest_.start_seq, e.what());
    }
  }
  std::optional<std::int64_t> local;
  if (!server && opts_.resume_local)
    local = state_.last_acked_seq;
  rep.resume_point =
      resolve_resume_point(manifest_.start_seq, opts_.resume_from, server, local);

  const auto todo = std::count_if(
      manifest_.chunks.begin(), manifest_.chunks.end(),
      [&](const ChunkInfo &c) { return c.seq >= rep.resume_point; });
  log::info("UPLOAD", "total=" + std::to_string(manifest_.chunk_count()) +
                          " uploading=" + std::to_string(todo) +
                          " resume_from=" + std::to_string(rep.resume_point));

  for (const auto &c : manifest_.chunks) {
    if (c.seq < rep.resume_point) {
      ++rep.chunks_skipped;
      continue;
    }
    if (cancel && cancel->load()) {
      rep.cancelled = true;
      log::warn("UPLOAD", "cancelled before seq=" + std::to_string(c.seq));
      break;
    }
    try {
      send_chunk(c, rep);
    } catch (const UploadAborted &e) {
      state_.mark_error(c.seq, e.reason());
      persist();
      throw;
    } catch (const SizeLimitExceeded &e) {
      state_.mark_error(c.seq, e.what());
      persist();
      log::error("UPLOAD", "chunk too large, re-plan with a smaller --chunk-size");
      throw UploadAborted(c.seq, e.what());
    } catch (const Error &e) {
      state_.mark_error(c.seq, e.what());
      persist();
      throw UploadAborted(c.seq, e.what());
    }
  }

  if (!rep.cancelled && !opts_.finalize_endpoint.empty()) {
    try {
      finalize(rep);
    } catch (const UploadAborted &) {
      throw;
    } catch (const Error &e) {
      throw UploadAborted(manifest_.chunks.back().seq,
                          std::string("finalize: ") + e.what());
    }
  }
  persist();
  return rep;
}

std::string shell_quote(const std::string &s) {
  if (!s.empty() && s.find_first_of(" \t\n\"'\\$`!()[]{}&|;<>?*") == std::string::npos)
    return s;
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\"'\"'";
    else
      out += c;
  }
  return out + "'";
}

std::vector<std::string> curl_commands(const Manifest &m,
                                       const std::filesystem::path &dir,
                                       const UploadOptions &opts,
                                       std::int64_t from_seq) {
  std::vector<std::string> out;
  for (const auto &c : m.chunks) {
    if (c.seq < from_seq)
      continue;
    std::vector<std::string> argv{"curl", "--fail", "-sS", "-X", "POST"};
    auto header = [&](const std::string &h) {
      argv.push_back("-H");
      argv.push_back(h);
    };
    header("Authorization: Bearer " + opts.bearer);
    header("Content-Type: application/x-ndjson");
    header("Idempotency-Key: " + m.idempotency_key);
    header("X-Batch-Seq: " + std::to_string(c.seq));
    if (c.gzip)
      header("Content-Encoding: gzip");
    argv.push_back("--data-binary");
    argv.push_back("@" + (dir / c.path).string());
    argv.push_back(opts.endpoint);

    std::string line;
    for (const auto &a : argv) {
      if (!line.empty())
        line += ' ';
      line += shell_quote(a);
    }
    out.push_back(std::move(line));
  }
  return out;
}

} // namespace chunkingest
