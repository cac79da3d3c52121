#pragma once
#include "manifest.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>

namespace chunkingest {

enum class InputFormat { auto_detect, array, ndjson };

const char *to_string(InputFormat f);
// "auto" | "array" | "ndjson", иначе std::invalid_argument
InputFormat input_format_from_string(const std::string &s);

// '[' первым непробельным символом — массив, иначе NDJSON
InputFormat detect_format(std::istream &in);

struct PlanOptions {
  std::size_t chunk_size = 10'000; // записей на чанк
  bool gzip = false;
  InputFormat format = InputFormat::auto_detect;
  std::string idempotency_key; // пусто — сгенерировать UUID
  std::string prefix = "chunk";
  std::int64_t start_seq = 0;
  // created_at манифеста; по умолчанию — текущее время UTC
  std::function<std::string()> clock;
};

// Делит источник на чанки и пишет их вместе с manifest.json в out_dir.
// Любая битая запись — ParseError, и ни чанков, ни манифеста не остаётся.
// Сеть не трогает.
class ChunkPlanner {
public:
  explicit ChunkPlanner(PlanOptions opts);

  Manifest plan(const std::filesystem::path &input,
                const std::filesystem::path &out_dir) const;
  Manifest plan(std::istream &input, const std::filesystem::path &out_dir) const;

  static std::string chunk_file_name(const std::string &prefix,
                                     std::int64_t seq, bool gzip);

private:
  PlanOptions opts_;
};

} // namespace chunkingest
