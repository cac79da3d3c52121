#pragma once
#include <string>

namespace chunkingest {
namespace log {

enum class Level { debug = 0, info = 1, warn = 2, error = 3 };

void set_level(Level level);
Level level();

// Дублировать вывод в файл (append). Пустой путь — отключить.
void set_file(const std::string &path);

void write(Level level, const char *tag, const std::string &msg);

inline void debug(const char *tag, const std::string &msg) {
  write(Level::debug, tag, msg);
}
inline void info(const char *tag, const std::string &msg) {
  write(Level::info, tag, msg);
}
inline void warn(const char *tag, const std::string &msg) {
  write(Level::warn, tag, msg);
}
inline void error(const char *tag, const std::string &msg) {
  write(Level::error, tag, msg);
}

} // namespace log
} // namespace chunkingest
