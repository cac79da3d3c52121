#include "chunkingest/chunk_planner.hpp"
#include "chunkingest/codec.hpp"
#include "chunkingest/errors.hpp"
#include "chunkingest/file_utils.hpp"
#include "chunkingest/log.hpp"
#include "chunkingest/time_utils.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using json = chunkingest::RecordJson;

namespace chunkingest {

const char *to_string(InputFormat f) {
  switch (f) {
  case InputFormat::auto_detect:
    return "auto";
  case InputFormat::array:
    return "array";
  case InputFormat::ndjson:
    return "ndjson";
  }
  return "auto";
}

InputFormat input_format_from_string(const std::string &s) {
  if (s == "auto")
    return InputFormat::auto_detect;
  if (s == "array")
    return InputFormat::array;
  if (s == "ndjson")
    return InputFormat::ndjson;
  throw std::invalid_argument("input format must be array, ndjson or auto");
}

InputFormat detect_format(std::istream &in) {
  in >> std::ws;
  return in.peek() == '[' ? InputFormat::array : InputFormat::ndjson;
}

namespace {

// Копит записи и сбрасывает чанк в staging-каталог
class ChunkWriter {
public:
  ChunkWriter(const PlanOptions &opts, fs::path staging)
      : opts_(opts), staging_(std::move(staging)), seq_(opts.start_seq) {}

  void add(json rec) {
    batch_.push_back(std::move(rec));
    if (batch_.size() >= opts_.chunk_size)
      flush();
  }

  void flush() {
    if (batch_.empty())
      return;
    const std::string raw = encode_ndjson(batch_);
    ChunkInfo info;
    info.seq = seq_;
    info.path = ChunkPlanner::chunk_file_name(opts_.prefix, seq_, opts_.gzip);
    info.count = batch_.size();
    info.md5 = md5_hex(raw);
    info.gzip = opts_.gzip;
    const std::string bytes = opts_.gzip ? gzip_compress(raw) : raw;
    info.size_bytes = bytes.size();
    write_file(staging_ / info.path, bytes);
    log::debug("PLAN", "seq=" + std::to_string(seq_) + " path=" + info.path +
                           " count=" + std::to_string(info.count) +
                           " size=" + std::to_string(info.size_bytes) + "B");

    total_ += batch_.size();
    chunks_.push_back(std::move(info));
    batch_.clear();
    ++seq_;
  }

  std::vector<ChunkInfo> &chunks() { return chunks_; }
  std::size_t total() const { return total_; }

private:
  const PlanOptions &opts_;
  fs::path staging_;
  std::int64_t seq_;
  std::vector<json> batch_;
  std::vector<ChunkInfo> chunks_;
  std::size_t total_{0};
};

void read_array(std::istream &in, ChunkWriter &w) {
  std::size_t index = 0;
  json::parser_callback_t cb = [&](int depth, json::parse_event_t ev,
                                   json &parsed) -> bool {
    if (depth == 0 && ev == json::parse_event_t::object_start)
      throw ParseError("input is not a JSON array");
    const bool element_done = ev == json::parse_event_t::object_end ||
                              ev == json::parse_event_t::array_end ||
                              ev == json::parse_event_t::value;
    if (depth != 1 || !element_done)
      return true;
    if (!parsed.is_object())
      throw ParseError("record " + std::to_string(index) +
                       " is not a JSON object");
    w.add(std::move(parsed));
    ++index;
    return false; // элемент не держим в памяти
  };

  json top;
  try {
    top = json::parse(in, cb);
  } catch (const json::parse_error &e) {
    throw ParseError("malformed JSON array after record " +
                     std::to_string(index) + ": " + e.what());
  }
  if (!top.is_array())
    throw ParseError("input is not a JSON array");
}

void read_ndjson(std::istream &in, ChunkWriter &w) {
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos)
      continue;
    json rec;
    try {
      rec = json::parse(line);
    } catch (const json::parse_error &e) {
      throw ParseError("invalid JSON at line " + std::to_string(line_no) +
                       ": " + e.what());
    }
    if (!rec.is_object())
      throw ParseError("line " + std::to_string(line_no) +
                       " is not a JSON object");
    w.add(std::move(rec));
  }
  if (in.bad())
    throw ParseError("read error after line " + std::to_string(line_no));
}

std::string new_idempotency_key() {
  boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

} // namespace

ChunkPlanner::ChunkPlanner(PlanOptions opts) : opts_(std::move(opts)) {
  if (opts_.chunk_size == 0)
    throw std::invalid_argument("chunk size must be >= 1");
  if (opts_.start_seq < 0)
    throw std::invalid_argument("start seq must be >= 0");
  if (opts_.prefix.empty())
    throw std::invalid_argument("prefix must not be empty");
}

std::string ChunkPlanner::chunk_file_name(const std::string &prefix,
                                          std::int64_t seq, bool gzip) {
  char num[32];
  std::snprintf(num, sizeof(num), "%06lld", static_cast<long long>(seq));
  return prefix + "_" + num + (gzip ? ".ndjson.gz" : ".ndjson");
}

Manifest ChunkPlanner::plan(const fs::path &input, const fs::path &out_dir) const {
  std::ifstream in(input, std::ios::binary);
  if (!in)
    throw ParseError("cannot open input " + input.string());
  return plan(in, out_dir);
}

Manifest ChunkPlanner::plan(std::istream &input, const fs::path &out_dir) const {
  fs::create_directories(out_dir);

  InputFormat fmt = opts_.format;
  if (fmt == InputFormat::auto_detect)
    fmt = detect_format(input);

  const fs::path staging =
      out_dir / (".staging-" + std::to_string(::getpid()));
  fs::remove_all(staging);
  fs::create_directories(staging);

  ChunkWriter writer(opts_, staging);
  try {
    if (fmt == InputFormat::array)
      read_array(input, writer);
    else
      read_ndjson(input, writer);
    writer.flush();
  } catch (const std::exception &) {
    std::error_code ec;
    fs::remove_all(staging, ec);
    throw;
  }

  // источник разобран целиком — переносим чанки и только потом пишем манифест
  for (const auto &c : writer.chunks())
    fs::rename(staging / c.path, out_dir / c.path);
  fs::remove_all(staging);

  Manifest m;
  m.created_at = opts_.clock ? opts_.clock() : utc_now_iso();
  m.idempotency_key = opts_.idempotency_key.empty() ? new_idempotency_key()
                                                    : opts_.idempotency_key;
  m.chunk_size = opts_.chunk_size;
  m.gzip = opts_.gzip;
  m.prefix = opts_.prefix;
  m.start_seq = opts_.start_seq;
  m.input_format = to_string(fmt);
  m.total_records = writer.total();
  m.chunks = std::move(writer.chunks());
  save_manifest(m, out_dir / kManifestFile);

  log::info("PLAN", "wrote " + std::to_string(m.chunk_count()) +
                        " chunk(s) with " + std::to_string(m.total_records) +
                        " record(s), Idempotency-Key: " + m.idempotency_key);
  return m;
}

} // namespace chunkingest
