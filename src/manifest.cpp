#include "chunkingest/manifest.hpp"
#include "chunkingest/errors.hpp"
#include "chunkingest/file_utils.hpp"

using json = nlohmann::json;
using ojson = nlohmann::ordered_json;

namespace chunkingest {

ojson to_json(const Manifest &m) {
  ojson chunks = ojson::array();
  for (const auto &c : m.chunks) {
    ojson e;
    e["seq"] = c.seq;
    e["path"] = c.path;
    e["count"] = c.count;
    e["size_bytes"] = c.size_bytes;
    e["md5"] = c.md5;
    e["gzip"] = c.gzip;
    chunks.push_back(std::move(e));
  }
  ojson j;
  j["created_at"] = m.created_at;
  j["idempotency_key"] = m.idempotency_key;
  j["chunk_size"] = m.chunk_size;
  j["gzip"] = m.gzip;
  j["prefix"] = m.prefix;
  j["start_seq"] = m.start_seq;
  j["input_format"] = m.input_format;
  j["total_records"] = m.total_records;
  j["total_chunks"] = m.chunk_count();
  j["chunks"] = std::move(chunks);
  return j;
}

Manifest manifest_from_json(const json &j) {
  Manifest m;
  try {
    m.created_at = j.value("created_at", std::string{});
    m.idempotency_key = j.at("idempotency_key").get<std::string>();
    m.chunk_size = j.at("chunk_size").get<std::size_t>();
    m.gzip = j.value("gzip", false);
    m.prefix = j.value("prefix", std::string{"chunk"});
    m.start_seq = j.value("start_seq", std::int64_t{0});
    m.input_format = j.value("input_format", std::string{});
    m.total_records = j.value("total_records", std::size_t{0});
    for (const auto &e : j.at("chunks")) {
      ChunkInfo c;
      c.seq = e.at("seq").get<std::int64_t>();
      c.path = e.at("path").get<std::string>();
      c.count = e.at("count").get<std::size_t>();
      c.size_bytes = e.value("size_bytes", std::uint64_t{0});
      c.md5 = e.at("md5").get<std::string>();
      c.gzip = e.value("gzip", false);
      m.chunks.push_back(std::move(c));
    }
  } catch (const json::exception &e) {
    throw ParseError(std::string("invalid manifest: ") + e.what());
  }
  if (m.idempotency_key.empty())
    throw ParseError("invalid manifest: empty idempotency_key");
  for (std::size_t i = 1; i < m.chunks.size(); ++i) {
    if (m.chunks[i].seq <= m.chunks[i - 1].seq)
      throw ParseError("invalid manifest: chunk seqs are not increasing");
  }
  return m;
}

void save_manifest(const Manifest &m, const std::filesystem::path &file) {
  write_file_atomic(file, to_json(m).dump(2) + "\n");
}

Manifest load_manifest(const std::filesystem::path &file) {
  const auto text = read_file(file);
  try {
    return manifest_from_json(json::parse(text));
  } catch (const json::parse_error &e) {
    throw ParseError(file.string() + ": " + e.what());
  }
}

} // namespace chunkingest
