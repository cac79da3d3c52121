#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkingest {

// Долговременная единица хранения.
// Уникальность: (identity, idempotency_key, seq, offset).
struct MetricRecord {
  std::string identity;
  std::string idempotency_key;
  std::int64_t seq{0};
  std::int64_t offset{0};
  std::string body; // компактный JSON
  std::string received_at;
};

enum class InsertOutcome { inserted, already_present };

// "Записать, если нет; сообщить о конфликте".
// Конфликт обязан разрешаться самим хранилищем, без блокировок приложения:
// из двух одновременных вставок одного кортежа ровно одна вернёт inserted.
class DedupStore {
public:
  virtual ~DedupStore() = default;

  // Бросает StorageError, если хранилище недоступно
  virtual InsertOutcome insert_if_absent(const MetricRecord &record) = 0;

  virtual std::size_t count(const std::string &identity,
                            const std::string &idempotency_key) = 0;

  // Все записи ключа, упорядочены по (seq, offset)
  virtual std::vector<MetricRecord>
  records(const std::string &identity, const std::string &idempotency_key) = 0;
};

} // namespace chunkingest
