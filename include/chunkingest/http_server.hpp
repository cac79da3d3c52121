#pragma once
#include "ingest_api.hpp"
#include "request_context.hpp"
#include "threadsafe_queue.hpp"
#include "types.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <memory>

namespace chunkingest {

class HttpServer {
public:
  // Бросает boost::system::system_error, если порт не удалось занять
  HttpServer(boost::asio::io_context &ioc, const Config &cfg,
             ThreadSafeQueue<EnqueuedTask> &queue, IngestApi &api);

  void run();
  void stop();

  unsigned short port() const;

private:
  struct Session;
  void do_accept();

  boost::asio::io_context &ioc_;
  const Config cfg_;
  ThreadSafeQueue<EnqueuedTask> &queue_;
  IngestApi &api_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::ip::tcp::socket socket_;
  std::atomic<bool> running_{false};
};

} // namespace chunkingest
