#pragma once
#include "identity.hpp"
#include "ingest_service.hpp"
#include "request_context.hpp"
#include <map>
#include <string>

namespace chunkingest {

// Запрос, уже вычитанный из сокета
struct ApiRequest {
  std::string method; // "GET", "POST"
  std::string target; // путь + query
  std::map<std::string, std::string> headers; // имена в нижнем регистре
  std::string body;

  // Пустая строка, если заголовка нет
  std::string header(const std::string &lower_name) const;
};

struct ApiOptions {
  std::string base_path;                       // напр. "/gd-cim-api"
  std::size_t max_decoded_bytes = 256u << 20;  // после распаковки gzip
};

// Маршрутизация и отображение ошибок в HTTP-статусы.
// Не бросает: любая ошибка превращается в ответ.
class IngestApi {
public:
  IngestApi(IngestService &service, const IdentityResolver &identity,
            ApiOptions opts = {});

  HttpReply handle(const ApiRequest &req);

private:
  HttpReply dispatch(const ApiRequest &req);

  HttpReply submit_one(const ApiRequest &req);
  HttpReply submit_batch(const ApiRequest &req);
  HttpReply submit_ndjson(const ApiRequest &req);
  HttpReply status(const ApiRequest &req);
  // Записи вызывающего по ключу, по (seq, offset)
  HttpReply my_records(const ApiRequest &req);
  HttpReply finalize(const ApiRequest &req);
  HttpReply admin_transition(const ApiRequest &req, bool to_stale);

  std::string require_identity(const ApiRequest &req) const;

  IngestService &service_;
  const IdentityResolver &identity_;
  ApiOptions opts_;
};

// Разбор "a=1&b=x%20y"
std::map<std::string, std::string> parse_query(const std::string &query);

} // namespace chunkingest
