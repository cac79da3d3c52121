#pragma once
#include <functional>
#include <memory>
#include <string>

namespace chunkingest {

struct HttpReply {
  int status{200};
  std::string body;
  std::string content_type{"application/json"};
};

// Обратный канал к сетевому exe для ответа клиенту
struct ReplyHandle {
  // вызывает write внутри strand/executor соединения
  std::function<void(HttpReply reply)> respond;
};

// Работа, которую воркер выполняет вне IO-потоков
struct EnqueuedTask {
  std::string request_id; // корреляция
  std::function<HttpReply()> work;
  std::shared_ptr<ReplyHandle> reply;
};

} // namespace chunkingest
