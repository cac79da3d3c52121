#include "chunkingest/log.hpp"
#include <atomic>
#include <boost/thread.hpp>
#include <cstdio>
#include <stdexcept>

namespace chunkingest {
namespace log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::info)};
boost::mutex g_mu;
std::FILE *g_file = nullptr;

const char *level_name(Level l) {
  switch (l) {
  case Level::debug:
    return "DBG";
  case Level::info:
    return "INF";
  case Level::warn:
    return "WRN";
  case Level::error:
    return "ERR";
  }
  return "???";
}

} // namespace

void set_level(Level level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() {
  return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

void set_file(const std::string &path) {
  boost::lock_guard<boost::mutex> lk(g_mu);
  if (g_file) {
    std::fclose(g_file);
    g_file = nullptr;
  }
  if (path.empty())
    return;
  g_file = std::fopen(path.c_str(), "a");
  if (!g_file)
    throw std::runtime_error("cannot open log file: " + path);
}

void write(Level l, const char *tag, const std::string &msg) {
  if (static_cast<int>(l) < g_level.load(std::memory_order_relaxed))
    return;
  boost::lock_guard<boost::mutex> lk(g_mu);
  std::fprintf(stderr, "[%s] %s\n", tag, msg.c_str());
  std::fflush(stderr);
  if (g_file) {
    std::fprintf(g_file, "%s [%s] %s\n", level_name(l), tag, msg.c_str());
    std::fflush(g_file);
  }
}

} // namespace log
} // namespace chunkingest
