#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace chunkingest {

struct ChunkInfo {
  std::int64_t seq{0};
  std::string path; // относительно каталога манифеста
  std::size_t count{0};
  std::uint64_t size_bytes{0}; // размер файла на диске
  std::string md5;             // по несжатому NDJSON
  bool gzip{false};
};

struct Manifest {
  std::string created_at;
  std::string idempotency_key;
  std::size_t chunk_size{0};
  bool gzip{false};
  std::string prefix;
  std::int64_t start_seq{0};
  std::string input_format;
  std::size_t total_records{0};
  std::vector<ChunkInfo> chunks; // по возрастанию seq

  std::size_t chunk_count() const { return chunks.size(); }
};

inline constexpr const char *kManifestFile = "manifest.json";

nlohmann::ordered_json to_json(const Manifest &m);
// Бросает ParseError на битом/неполном манифесте
Manifest manifest_from_json(const nlohmann::json &j);

void save_manifest(const Manifest &m, const std::filesystem::path &file);
Manifest load_manifest(const std::filesystem::path &file);

} // namespace chunkingest
