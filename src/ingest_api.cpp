#include "chunkingest/ingest_api.hpp"
#include "chunkingest/codec.hpp"
#include "chunkingest/errors.hpp"
#include "chunkingest/log.hpp"
#include "chunkingest/metrics_export.hpp"
#include "chunkingest/time_utils.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <limits>
#include <optional>

using ojson = nlohmann::ordered_json;

namespace chunkingest {

namespace {

HttpReply reply(int status, const ojson &body) { return {status, body.dump()}; }

HttpReply error_reply(int status, const std::string &error,
                      const std::string &msg) {
  ojson j;
  j["error"] = error;
  j["msg"] = msg;
  return reply(status, j);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}

std::string url_decode(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '+') {
      out += ' ';
    } else if (s[i] == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 &&
               hex_value(s[i + 2]) >= 0) {
      out += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
      i += 2;
    } else {
      out += s[i];
    }
  }
  return out;
}

std::int64_t parse_seq(const std::string &raw) {
  const std::string s = boost::algorithm::trim_copy(raw);
  if (s.empty() || s.size() > 18)
    throw ValidationError(400, "X-Batch-Seq must be a non-negative integer");
  for (char c : s) {
    if (c < '0' || c > '9')
      throw ValidationError(400, "X-Batch-Seq must be a non-negative integer");
  }
  return std::stoll(s);
}

struct IdemHeaders {
  std::string key;
  std::optional<std::int64_t> seq;
  bool present() const { return !key.empty() && seq.has_value(); }
};

// Idempotency-Key + Batch-Seq / X-Batch-Seq. Либо оба, либо ни одного.
IdemHeaders read_idem_headers(const ApiRequest &req) {
  IdemHeaders h;
  h.key = boost::algorithm::trim_copy(req.header("idempotency-key"));
  std::string seq = req.header("batch-seq");
  if (seq.empty())
    seq = req.header("x-batch-seq");
  if (!seq.empty())
    h.seq = parse_seq(seq);
  if (h.key.empty() != !h.seq.has_value())
    throw ValidationError(400, "Idempotency-Key and X-Batch-Seq must be sent "
                               "together");
  return h;
}

RecordJson parse_body(const std::string &body) {
  try {
    return RecordJson::parse(body);
  } catch (const RecordJson::parse_error &e) {
    throw ValidationError(400, std::string("invalid JSON body: ") + e.what());
  }
}

std::string new_key() {
  static thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

ojson chunk_reply(const ChunkOutcome &o) {
  ojson j;
  j["ok"] = true;
  j["inserted"] = o.inserted;
  if (o.duplicate)
    j["duplicate"] = true;
  j["next_expected_seq"] = o.next_expected_seq;
  return j;
}

std::map<std::string, std::string> query_of(const ApiRequest &req) {
  const auto pos = req.target.find('?');
  return parse_query(pos == std::string::npos ? std::string{}
                                              : req.target.substr(pos + 1));
}

std::string required_param(const std::map<std::string, std::string> &q,
                           const std::string &name) {
  auto it = q.find(name);
  if (it == q.end() || it->second.empty())
    throw ValidationError(400, name + " query parameter is required");
  return it->second;
}

std::string media_type(const std::string &content_type) {
  auto semi = content_type.find(';');
  return boost::algorithm::to_lower_copy(
      boost::algorithm::trim_copy(content_type.substr(0, semi)));
}

} // namespace

std::string ApiRequest::header(const std::string &lower_name) const {
  auto it = headers.find(lower_name);
  return it == headers.end() ? std::string{} : it->second;
}

std::map<std::string, std::string> parse_query(const std::string &query) {
  std::map<std::string, std::string> out;
  std::vector<std::string> parts;
  boost::algorithm::split(parts, query, boost::algorithm::is_any_of("&"));
  for (const auto &p : parts) {
    if (p.empty())
      continue;
    auto eq = p.find('=');
    if (eq == std::string::npos)
      out[url_decode(p)] = "";
    else
      out[url_decode(p.substr(0, eq))] = url_decode(p.substr(eq + 1));
  }
  return out;
}

IngestApi::IngestApi(IngestService &service, const IdentityResolver &identity,
                     ApiOptions opts)
    : service_(service), identity_(identity), opts_(std::move(opts)) {
  while (!opts_.base_path.empty() && opts_.base_path.back() == '/')
    opts_.base_path.pop_back();
}

HttpReply IngestApi::handle(const ApiRequest &req) {
  try {
    return dispatch(req);
  } catch (const AuthError &e) {
    return error_reply(e.http_status(), "unauthorized", e.what());
  } catch (const ValidationError &e) {
    g_chunks_rejected.fetch_add(1, std::memory_order_relaxed);
    return error_reply(e.http_status(), "bad request", e.what());
  } catch (const ParseError &e) {
    g_chunks_rejected.fetch_add(1, std::memory_order_relaxed);
    return error_reply(400, "bad request", e.what());
  } catch (const SizeLimitExceeded &e) {
    g_chunks_rejected.fetch_add(1, std::memory_order_relaxed);
    return error_reply(413, "size limit exceeded", e.what());
  } catch (const InvalidTransition &e) {
    return error_reply(409, "invalid transition", e.what());
  } catch (const StorageError &e) {
    log::error("API", std::string("storage: ") + e.what());
    return error_reply(503, "storage unavailable", e.what());
  } catch (const std::exception &e) {
    log::error("API", std::string("unhandled: ") + e.what());
    return error_reply(500, "internal error", e.what());
  }
}

HttpReply IngestApi::dispatch(const ApiRequest &req) {
  std::string path = req.target.substr(0, req.target.find('?'));
  if (!opts_.base_path.empty()) {
    if (!boost::algorithm::starts_with(path, opts_.base_path))
      return error_reply(404, "not found", path);
    path = path.substr(opts_.base_path.size());
  }
  const bool get = req.method == "GET";
  const bool post = req.method == "POST";

  if (get && path == "/healthz")
    return reply(200, ojson{{"status", "ok"}});
  if (get && path == "/metrics")
    return {200, render_metrics(), "text/plain; version=0.0.4"};
  if (post && path == "/submit")
    return submit_one(req);
  if (post && path == "/submit/batch")
    return submit_batch(req);
  if (post && path == "/submit/ndjson")
    return submit_ndjson(req);
  if (get && path == "/ingest/status")
    return status(req);
  if (get && path == "/metrics/me")
    return my_records(req);
  if (post && path == "/ingest/finalize")
    return finalize(req);
  if (post && path == "/admin/ingest/stale")
    return admin_transition(req, true);
  if (post && path == "/admin/ingest/finalize")
    return admin_transition(req, false);
  return error_reply(404, "not found", req.method + " " + path);
}

std::string IngestApi::require_identity(const ApiRequest &req) const {
  const auto token = bearer_token(req.header("authorization"));
  if (token.empty())
    throw AuthError(401, "missing bearer token");
  auto who = identity_.resolve(token);
  if (!who)
    throw AuthError(401, "invalid token");
  return *who;
}

HttpReply IngestApi::submit_one(const ApiRequest &req) {
  const auto who = require_identity(req);
  const auto idem = read_idem_headers(req);
  RecordJson body = parse_body(req.body);

  ChunkRequest chunk;
  chunk.identity = who;
  chunk.idempotency_key = idem.present() ? idem.key : new_key();
  chunk.seq = idem.present() ? *idem.seq : 0;
  chunk.records.push_back(std::move(body));

  const auto o = service_.commit_chunk(chunk);
  ojson j;
  j["ok"] = true;
  j["inserted"] = o.inserted;
  if (o.duplicate)
    j["duplicate"] = true;
  j["idempotency_key"] = chunk.idempotency_key;
  j["received_at"] = utc_now_iso();
  if (idem.present())
    j["next_expected_seq"] = o.next_expected_seq;
  return reply(200, j);
}

HttpReply IngestApi::submit_batch(const ApiRequest &req) {
  const auto who = require_identity(req);
  const auto idem = read_idem_headers(req);
  if (!idem.present())
    throw ValidationError(400, "Missing Idempotency-Key or X-Batch-Seq");

  RecordJson body = parse_body(req.body);
  if (!body.is_array())
    throw ValidationError(422, "Body must be a JSON array of objects");

  ChunkRequest chunk;
  chunk.identity = who;
  chunk.idempotency_key = idem.key;
  chunk.seq = *idem.seq;
  chunk.records.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (!body[i].is_object())
      throw ValidationError(422, "element " + std::to_string(i) +
                                     " is not a JSON object");
    chunk.records.push_back(std::move(body[i]));
  }
  return reply(200, chunk_reply(service_.commit_chunk(chunk)));
}

HttpReply IngestApi::submit_ndjson(const ApiRequest &req) {
  const auto who = require_identity(req);
  const auto ctype = media_type(req.header("content-type"));
  if (ctype != "application/x-ndjson")
    throw ValidationError(400, "Content-Type must be application/x-ndjson, "
                               "got " +
                                   (ctype.empty() ? "<missing>" : ctype));
  const auto encoding = boost::algorithm::to_lower_copy(
      boost::algorithm::trim_copy(req.header("content-encoding")));
  if (!encoding.empty() && encoding != "gzip" && encoding != "identity")
    throw ValidationError(400, "unsupported Content-Encoding: " + encoding);
  const auto idem = read_idem_headers(req);

  ChunkRequest chunk;
  chunk.identity = who;
  chunk.idempotency_key = idem.present() ? idem.key : new_key();
  chunk.seq = idem.present() ? *idem.seq : 0;
  // весь поток разбирается до первой записи: битая строка ничего не пишет
  chunk.records =
      decode_ndjson(req.body, encoding == "gzip", opts_.max_decoded_bytes);

  const auto o = service_.commit_chunk(chunk);
  if (idem.present())
    return reply(200, chunk_reply(o));
  ojson j;
  j["ok"] = true;
  j["inserted"] = o.inserted;
  return reply(200, j);
}

HttpReply IngestApi::status(const ApiRequest &req) {
  const auto who = require_identity(req);
  const auto key = required_param(query_of(req), "idempotency_key");

  const auto s = service_.tracker().status({who, key});
  ojson j;
  if (!s) {
    j["status"] = "none";
    j["next_expected_seq"] = 0;
    j["processed"] = ojson::array();
    j["missing"] = ojson::array();
    return reply(200, j);
  }
  j["status"] = to_string(s->status);
  j["next_expected_seq"] = s->next_expected_seq;
  j["last_update"] = s->last_update;
  j["processed"] = s->committed_seqs;
  j["missing"] = missing_seqs(*s);
  return reply(200, j);
}

HttpReply IngestApi::my_records(const ApiRequest &req) {
  const auto who = require_identity(req);
  const auto key = required_param(query_of(req), "idempotency_key");

  ojson out = ojson::array();
  for (const auto &r : service_.store().records(who, key)) {
    ojson j;
    j["publisher"] = r.identity;
    j["idempotency_key"] = r.idempotency_key;
    j["seq"] = r.seq;
    j["offset"] = r.offset;
    j["received_at"] = r.received_at;
    try {
      j["body"] = ojson::parse(r.body);
    } catch (const ojson::parse_error &e) {
      throw StorageError("stored body of seq=" + std::to_string(r.seq) +
                         " offset=" + std::to_string(r.offset) +
                         " is not JSON: " + e.what());
    }
    out.push_back(std::move(j));
  }
  return reply(200, out);
}

HttpReply IngestApi::finalize(const ApiRequest &req) {
  const auto who = require_identity(req);
  const auto key = required_param(query_of(req), "idempotency_key");

  const auto s = service_.tracker().finalize({who, key});
  ojson j;
  j["ok"] = true;
  j["status"] = to_string(s.status);
  j["next_expected_seq"] = s.next_expected_seq;
  return reply(200, j);
}

HttpReply IngestApi::admin_transition(const ApiRequest &req, bool to_stale) {
  const auto token = bearer_token(req.header("authorization"));
  if (token.empty())
    throw AuthError(401, "missing bearer token");
  if (!identity_.is_admin(token))
    return error_reply(403, "forbidden", "admin token required");

  const auto q = query_of(req);
  const SessionKey sk{required_param(q, "publisher"),
                      required_param(q, "idempotency_key")};
  const auto s = to_stale ? service_.tracker().mark_stale(sk)
                          : service_.tracker().finalize(sk);
  ojson j;
  j["ok"] = true;
  j["status"] = to_string(s.status);
  j["next_expected_seq"] = s.next_expected_seq;
  return reply(200, j);
}

} // namespace chunkingest
