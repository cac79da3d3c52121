#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace chunkingest {

enum class ChunkAck { acked, duplicate, error };

const char *to_string(ChunkAck a);
ChunkAck chunk_ack_from_string(const std::string &s);

struct ChunkAckEntry {
  ChunkAck status{ChunkAck::acked};
  std::size_t inserted{0};
  std::string error;
};

// Локальный журнал клиента. Только подсказка для возобновления,
// источник истины — статус сессии на сервере.
struct UploadState {
  std::string idempotency_key;
  std::optional<std::int64_t> last_acked_seq;
  std::map<std::int64_t, ChunkAckEntry> chunks;
  std::string updated_at;

  void mark_acked(std::int64_t seq, std::size_t inserted, bool duplicate);
  void mark_error(std::int64_t seq, const std::string &error);
};

inline constexpr const char *kUploadStateFile = "upload_state.json";
inline constexpr const char *kProgressLogFile = "progress.jsonl";

nlohmann::ordered_json to_json(const UploadState &s);
UploadState upload_state_from_json(const nlohmann::json &j);

void save_upload_state(const UploadState &s, const std::filesystem::path &file);
// Нет файла — nullopt; битый файл — ParseError
std::optional<UploadState> load_upload_state(const std::filesystem::path &file);

// progress.jsonl: одна строка на подтверждённый чанк
class ProgressLog {
public:
  explicit ProgressLog(std::filesystem::path file) : file_(std::move(file)) {}

  void append(std::int64_t seq, const std::string &path, std::size_t inserted,
              bool duplicate, const std::string &ts) const;

  const std::filesystem::path &file() const { return file_; }

private:
  std::filesystem::path file_;
};

} // namespace chunkingest
