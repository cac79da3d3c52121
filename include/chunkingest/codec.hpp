#pragma once
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace chunkingest {

// Запись публикатора: порядок ключей сохраняется как прислали
using RecordJson = nlohmann::ordered_json;

// MD5 (hex, lower case), как в манифесте
std::string md5_hex(std::string_view data);

// gzip с нулевым mtime в заголовке — одинаковый вход даёт одинаковые байты
std::string gzip_compress(std::string_view data);

// Бросает ParseError на битом потоке и SizeLimitExceeded при выходе за max_bytes
std::string gzip_decompress(std::string_view data, std::size_t max_bytes);

// Одна компактная JSON-строка на запись, каждая с '\n'
std::string encode_ndjson(const std::vector<RecordJson> &records);

// Построчный разбор NDJSON (при gzip=true — с распаковкой на лету).
// Пустые строки пропускаются; каждая запись обязана быть JSON-объектом.
// Первая же ошибка прерывает разбор: ParseError с номером строки.
// Лимит max_decoded_bytes проверяется по блокам при чтении, до склейки строк.
std::vector<RecordJson> decode_ndjson(std::string_view body, bool gzip,
                                      std::size_t max_decoded_bytes);

} // namespace chunkingest
