#include "chunkingest/file_utils.hpp"
#include "chunkingest/errors.hpp"
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace chunkingest {

std::string read_file(const fs::path &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f)
    throw Error("cannot open " + path.string());
  std::string data((std::istreambuf_iterator<char>(f)),
                   std::istreambuf_iterator<char>());
  if (f.bad())
    throw Error("read failed: " + path.string());
  return data;
}

void write_file(const fs::path &path, const std::string &data) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f)
    throw Error("cannot create " + path.string());
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  f.flush();
  if (!f)
    throw Error("write failed: " + path.string());
}

void write_file_atomic(const fs::path &path, const std::string &data) {
  fs::path tmp = path;
  tmp += ".tmp";
  write_file(tmp, data);
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec)
    throw Error("rename " + tmp.string() + " -> " + path.string() + ": " +
                ec.message());
}

} // namespace chunkingest
