// src/http_server.cpp
#include "chunkingest/http_server.hpp"
#include "chunkingest/log.hpp"
#include "chunkingest/worker_pool.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <optional>
#include <random>
#include <sstream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace chunkingest {

struct HttpServer::Session
    : public std::enable_shared_from_this<HttpServer::Session> {
  tcp::socket socket;
  ThreadSafeQueue<EnqueuedTask> &queue;
  IngestApi &api;
  const Config &cfg;

  beast::flat_buffer buffer;
  std::optional<http::request_parser<http::string_body>> parser;
  http::response<http::string_body> res;
  unsigned req_version{11};
  bool responded{false};
  std::string request_id;

  // strand от executora сокета — корректный тип под any_io_executor
  net::strand<net::any_io_executor> strand;
  net::steady_timer timer;

  explicit Session(tcp::socket s, ThreadSafeQueue<EnqueuedTask> &q,
                   IngestApi &a, const Config &c)
      : socket(std::move(s)), queue(q), api(a), cfg(c),
        strand(net::make_strand(socket.get_executor())), timer(strand) {}

  void run() { read_request(); }

  void read_request() {
    parser.emplace();
    parser->body_limit(cfg.max_body_bytes);
    auto self = shared_from_this();
    http::async_read(
        socket, buffer, *parser,
        net::bind_executor(strand, [self](beast::error_code ec, std::size_t) {
          if (ec == http::error::body_limit) {
            self->write_response(
                {413, R"({"error":"size limit exceeded","msg":)"
                      R"("request body exceeds max_body_bytes"})"});
            return;
          }
          if (!ec)
            self->handle_request();
        }));
  }

  static std::string gen_req_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::stringstream ss;
    ss << std::hex << rng();
    return ss.str();
  }

  void handle_request() {
    auto req = parser->release();
    req_version = req.version();
    request_id = gen_req_id();

    ApiRequest in;
    in.method = std::string(req.method_string());
    in.target = std::string(req.target());
    for (const auto &f : req)
      in.headers[boost::algorithm::to_lower_copy(std::string(f.name_string()))] =
          std::string(f.value());
    in.body = std::move(req.body());
    log::debug("HTTP", request_id + " " + in.method + " " + in.target + " " +
                           std::to_string(in.body.size()) + "B");

    auto reply = std::make_shared<ReplyHandle>();
    reply->respond = [self = shared_from_this()](HttpReply r) {
      net::dispatch(self->strand, [self, r = std::move(r)]() mutable {
        self->write_response(std::move(r));
      });
    };

    EnqueuedTask task;
    task.request_id = request_id;
    task.work = [api = &api, in = std::move(in)]() { return api->handle(in); };
    task.reply = reply;

    if (!submit_task(queue, std::move(task))) {
      write_response({503, R"({"error":"queue full"})"});
      return;
    }

    // воркер не успел — 503; повтор безопасен благодаря дедупликации
    auto self = shared_from_this();
    timer.expires_after(std::chrono::milliseconds(cfg.commit_timeout_ms));
    timer.async_wait(net::bind_executor(
        strand, [self](const boost::system::error_code &ec) {
          if (ec)
            return; // отменён — уже ответили
          log::warn("HTTP", self->request_id + " commit timeout");
          self->write_response({503, R"({"error":"commit timeout"})"});
        }));
  }

  void write_response(HttpReply r) {
    if (responded)
      return; // второй ответ (таймер/воркер) отбрасываем
    responded = true;
    timer.cancel();

    res.version(req_version);
    res.keep_alive(false);
    res.result(static_cast<http::status>(r.status));
    res.set(http::field::content_type, r.content_type);
    res.body() = std::move(r.body);
    res.prepare_payload();

    auto self = shared_from_this();
    http::async_write(
        socket, res,
        net::bind_executor(strand, [self](beast::error_code, std::size_t) {
          beast::error_code ec;
          self->socket.shutdown(tcp::socket::shutdown_send, ec);
        }));
  }
};

HttpServer::HttpServer(net::io_context &ioc, const Config &cfg,
                       ThreadSafeQueue<EnqueuedTask> &queue, IngestApi &api)
    : ioc_(ioc), cfg_(cfg), queue_(queue), api_(api), acceptor_(ioc),
      socket_(ioc) {
  tcp::endpoint ep{net::ip::make_address(cfg_.host),
                   static_cast<unsigned short>(cfg_.port)};
  acceptor_.open(ep.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen(net::socket_base::max_listen_connections);
}

unsigned short HttpServer::port() const {
  return acceptor_.local_endpoint().port();
}

void HttpServer::run() {
  if (running_.exchange(true))
    return;
  do_accept();
}

void HttpServer::stop() {
  if (!running_.exchange(false))
    return;
  beast::error_code ec;
  acceptor_.close(ec);
}

void HttpServer::do_accept() {
  acceptor_.async_accept(socket_, [this](beast::error_code ec) {
    if (!ec) {
      std::make_shared<Session>(std::move(socket_), queue_, api_, cfg_)->run();
    } else if (running_) {
      log::warn("HTTP", "accept: " + ec.message());
    }
    if (running_)
      do_accept();
  });
}

} // namespace chunkingest
