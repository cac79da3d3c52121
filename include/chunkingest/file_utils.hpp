#pragma once
#include <filesystem>
#include <string>

namespace chunkingest {

// Бросают chunkingest::Error с путём в сообщении
std::string read_file(const std::filesystem::path &path);
void write_file(const std::filesystem::path &path, const std::string &data);

// temp + rename: читатель видит либо старый файл, либо новый целиком
void write_file_atomic(const std::filesystem::path &path,
                       const std::string &data);

} // namespace chunkingest
