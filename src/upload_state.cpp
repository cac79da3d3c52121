#include "chunkingest/upload_state.hpp"
#include "chunkingest/errors.hpp"
#include "chunkingest/file_utils.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;
using ojson = nlohmann::ordered_json;

namespace chunkingest {

const char *to_string(ChunkAck a) {
  switch (a) {
  case ChunkAck::acked:
    return "acked";
  case ChunkAck::duplicate:
    return "duplicate";
  case ChunkAck::error:
    return "error";
  }
  return "error";
}

ChunkAck chunk_ack_from_string(const std::string &s) {
  if (s == "acked")
    return ChunkAck::acked;
  if (s == "duplicate")
    return ChunkAck::duplicate;
  if (s == "error")
    return ChunkAck::error;
  throw std::invalid_argument("unknown chunk status: " + s);
}

void UploadState::mark_acked(std::int64_t seq, std::size_t inserted,
                             bool duplicate) {
  ChunkAckEntry &e = chunks[seq];
  e.status = duplicate ? ChunkAck::duplicate : ChunkAck::acked;
  e.inserted = inserted;
  e.error.clear();
  last_acked_seq = last_acked_seq ? std::max(*last_acked_seq, seq) : seq;
}

void UploadState::mark_error(std::int64_t seq, const std::string &error) {
  ChunkAckEntry &e = chunks[seq];
  e.status = ChunkAck::error;
  e.inserted = 0;
  e.error = error;
}

ojson to_json(const UploadState &s) {
  ojson chunks = ojson::object();
  for (const auto &[seq, e] : s.chunks) {
    ojson c;
    c["status"] = to_string(e.status);
    c["inserted"] = e.inserted;
    if (!e.error.empty())
      c["error"] = e.error;
    chunks[std::to_string(seq)] = std::move(c);
  }
  ojson j;
  j["idempotency_key"] = s.idempotency_key;
  j["last_acked_seq"] = s.last_acked_seq ? ojson(*s.last_acked_seq) : ojson(nullptr);
  j["chunks"] = std::move(chunks);
  j["updated_at"] = s.updated_at;
  return j;
}

UploadState upload_state_from_json(const json &j) {
  UploadState s;
  try {
    s.idempotency_key = j.at("idempotency_key").get<std::string>();
    const auto &last = j.at("last_acked_seq");
    if (!last.is_null())
      s.last_acked_seq = last.get<std::int64_t>();
    for (const auto &[k, v] : j.at("chunks").items()) {
      ChunkAckEntry e;
      e.status = chunk_ack_from_string(v.at("status").get<std::string>());
      e.inserted = v.value("inserted", std::size_t{0});
      e.error = v.value("error", std::string{});
      s.chunks[std::stoll(k)] = std::move(e);
    }
    s.updated_at = j.value("updated_at", std::string{});
  } catch (const json::exception &e) {
    throw ParseError(std::string("invalid upload state: ") + e.what());
  } catch (const std::invalid_argument &e) {
    throw ParseError(std::string("invalid upload state: ") + e.what());
  } catch (const std::out_of_range &e) {
    throw ParseError(std::string("invalid upload state: ") + e.what());
  }
  return s;
}

void save_upload_state(const UploadState &s, const std::filesystem::path &file) {
  write_file_atomic(file, to_json(s).dump(2) + "\n");
}

std::optional<UploadState> load_upload_state(const std::filesystem::path &file) {
  if (!std::filesystem::exists(file))
    return std::nullopt;
  const auto text = read_file(file);
  try {
    return upload_state_from_json(json::parse(text));
  } catch (const json::parse_error &e) {
    throw ParseError(file.string() + ": " + e.what());
  }
}

void ProgressLog::append(std::int64_t seq, const std::string &path,
                         std::size_t inserted, bool duplicate,
                         const std::string &ts) const {
  ojson line;
  line["seq"] = seq;
  line["path"] = path;
  line["inserted"] = inserted;
  line["duplicate"] = duplicate;
  line["ts"] = ts;

  std::ofstream f(file_, std::ios::app | std::ios::binary);
  if (!f)
    throw Error("cannot open " + file_.string());
  f << line.dump() << '\n';
  f.flush();
  if (!f)
    throw Error("write failed: " + file_.string());
}

} // namespace chunkingest
