#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace chunkingest {

struct Url {
  std::string scheme; // http | https
  std::string host;
  std::uint16_t port{0};
  std::string target{"/"}; // путь с query

  bool tls() const { return scheme == "https"; }
};

// Бросает std::invalid_argument на неподдерживаемой схеме/порте
Url parse_url(const std::string &url);

// Добавляет к URL query-параметр (значение процентно экранируется)
std::string with_query(const std::string &url, const std::string &name,
                       const std::string &value);

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
  int status{0};
  std::string body;
};

// Один HTTP-запрос с таймаутом. Любой сбой соединения или таймаут —
// NetworkError; статус ответа (включая 4xx/5xx) возвращается как есть.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse request(const std::string &method, const std::string &url,
                               const HeaderList &headers, const std::string &body,
                               std::chrono::milliseconds timeout) = 0;
};

// Boost.Beast: обычный TCP или TLS (Asio SSL) для https://
class BeastTransport : public HttpTransport {
public:
  explicit BeastTransport(bool verify_peer = true);
  ~BeastTransport() override;

  HttpResponse request(const std::string &method, const std::string &url,
                       const HeaderList &headers, const std::string &body,
                       std::chrono::milliseconds timeout) override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace chunkingest
