#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace chunkingest {

// Базовый тип всех ошибок проекта
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Некорректный источник данных (план не строится)
class ParseError : public Error {
public:
  using Error::Error;
};

// Транспорт/таймаут, повторяемая
class NetworkError : public Error {
public:
  using Error::Error;
};

// Отказ сервера (4xx, не дубликат), не повторяется
class ServerRejectError : public Error {
public:
  ServerRejectError(int http_status, const std::string &msg)
      : Error(msg), http_status_(http_status) {}

  int http_status() const noexcept { return http_status_; }

private:
  int http_status_;
};

class AuthError : public ServerRejectError {
public:
  using ServerRejectError::ServerRejectError;
};

// Чанк превышает лимит хранилища/запроса — нужно перепланировать
class SizeLimitExceeded : public Error {
public:
  using Error::Error;
};

// Плохие заголовки или форма тела запроса
class ValidationError : public Error {
public:
  ValidationError(int http_status, const std::string &msg)
      : Error(msg), http_status_(http_status) {}

  int http_status() const noexcept { return http_status_; }

private:
  int http_status_;
};

class StorageError : public Error {
public:
  using Error::Error;
};

class InvalidTransition : public Error {
public:
  using Error::Error;
};

// Содержимое чанка на диске не совпадает с манифестом
class IntegrityError : public Error {
public:
  using Error::Error;
};

// Финальная ошибка загрузки с привязкой к seq
class UploadAborted : public Error {
public:
  UploadAborted(std::int64_t seq, const std::string &reason)
      : Error("upload aborted at seq=" + std::to_string(seq) + ": " + reason),
        seq_(seq), reason_(reason) {}

  std::int64_t seq() const noexcept { return seq_; }
  const std::string &reason() const noexcept { return reason_; }

private:
  std::int64_t seq_;
  std::string reason_;
};

} // namespace chunkingest
