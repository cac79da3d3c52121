#include "chunkingest/transport.hpp"
#include "chunkingest/errors.hpp"
#include "chunkingest/log.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace chunkingest {

Url parse_url(const std::string &url) {
  Url u;
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos)
    throw std::invalid_argument("url without scheme: " + url);
  u.scheme = url.substr(0, scheme_end);
  for (auto &c : u.scheme)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (u.scheme != "http" && u.scheme != "https")
    throw std::invalid_argument("unsupported url scheme: " + u.scheme);

  const auto rest = url.substr(scheme_end + 3);
  const auto slash = rest.find_first_of("/?");
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    u.target = rest.substr(slash);
    if (u.target[0] == '?')
      u.target.insert(0, "/");
  }

  u.port = u.tls() ? 443 : 80;
  const auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
    const auto port_str = authority.substr(colon + 1);
    authority.resize(colon);
    int port = 0;
    try {
      std::size_t used = 0;
      port = std::stoi(port_str, &used);
      if (used != port_str.size())
        port = 0;
    } catch (const std::exception &) {
      port = 0;
    }
    if (port <= 0 || port > 65535)
      throw std::invalid_argument("bad port in url: " + url);
    u.port = static_cast<std::uint16_t>(port);
  }
  if (authority.size() > 2 && authority.front() == '[' && authority.back() == ']')
    authority = authority.substr(1, authority.size() - 2);
  if (authority.empty())
    throw std::invalid_argument("url without host: " + url);
  u.host = authority;
  return u;
}

std::string with_query(const std::string &url, const std::string &name,
                       const std::string &value) {
  std::string enc;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      enc += static_cast<char>(c);
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      enc += buf;
    }
  }
  const char sep = url.find('?') == std::string::npos ? '?' : '&';
  return url + sep + name + "=" + enc;
}

namespace {

// Прогоняет io_context до завершения текущей асинхронной операции
void run_until_done(net::io_context &ioc) {
  ioc.restart();
  ioc.run();
}

void check(const beast::error_code &ec, const char *stage, const Url &u) {
  if (!ec)
    return;
  throw NetworkError(std::string(stage) + " " + u.host + ":" +
                     std::to_string(u.port) + ": " + ec.message());
}

template <class Stream, class Lowest>
HttpResponse exchange(net::io_context &ioc, Stream &stream, Lowest &lowest,
                      const Url &u, http::request<http::string_body> &req,
                      std::chrono::milliseconds timeout) {
  beast::error_code ec;
  lowest.expires_after(timeout);
  http::async_write(stream, req,
                    [&](beast::error_code e, std::size_t) { ec = e; });
  run_until_done(ioc);
  check(ec, "write", u);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(64 * 1024 * 1024);
  lowest.expires_after(timeout);
  http::async_read(stream, buffer, parser,
                   [&](beast::error_code e, std::size_t) { ec = e; });
  run_until_done(ioc);
  check(ec, "read", u);

  HttpResponse out;
  out.status = static_cast<int>(parser.get().result_int());
  out.body = std::move(parser.get().body());
  return out;
}

} // namespace

struct BeastTransport::Impl {
  net::io_context ioc;
  ssl::context ssl_ctx{ssl::context::tls_client};
};

BeastTransport::BeastTransport(bool verify_peer) : impl_(std::make_unique<Impl>()) {
  impl_->ssl_ctx.set_default_verify_paths();
  impl_->ssl_ctx.set_verify_mode(verify_peer ? ssl::verify_peer : ssl::verify_none);
}

BeastTransport::~BeastTransport() = default;

HttpResponse BeastTransport::request(const std::string &method,
                                     const std::string &url,
                                     const HeaderList &headers,
                                     const std::string &body,
                                     std::chrono::milliseconds timeout) {
  const Url u = parse_url(url);
  auto &ioc = impl_->ioc;

  http::request<http::string_body> req;
  req.method(http::string_to_verb(method));
  if (req.method() == http::verb::unknown)
    throw std::invalid_argument("unsupported http method: " + method);
  req.target(u.target);
  req.version(11);
  req.set(http::field::host, u.host);
  req.set(http::field::user_agent, "chunkingest-upload");
  req.set(http::field::connection, "close");
  for (const auto &h : headers)
    req.set(h.first, h.second);
  req.body() = body;
  req.prepare_payload();

  log::debug("HTTP", method + " " + url + " (" + std::to_string(body.size()) + "B)");

  // резолв с ограничением по времени
  tcp::resolver resolver(ioc);
  tcp::resolver::results_type results;
  beast::error_code ec;
  bool resolved = false;
  resolver.async_resolve(u.host, std::to_string(u.port),
                         [&](beast::error_code e, tcp::resolver::results_type r) {
                           ec = e;
                           results = std::move(r);
                           resolved = true;
                         });
  ioc.restart();
  ioc.run_for(timeout);
  if (!resolved) {
    resolver.cancel();
    run_until_done(ioc);
    throw NetworkError("resolve " + u.host + ": timeout");
  }
  check(ec, "resolve", u);

  if (!u.tls()) {
    beast::tcp_stream stream(ioc);
    stream.expires_after(timeout);
    stream.async_connect(results, [&](beast::error_code e, const tcp::endpoint &) { ec = e; });
    run_until_done(ioc);
    check(ec, "connect", u);

    auto res = exchange(ioc, stream, stream, u, req, timeout);
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
  }

  beast::ssl_stream<beast::tcp_stream> stream(ioc, impl_->ssl_ctx);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str()))
    throw NetworkError("tls: cannot set SNI host " + u.host);
  auto &lowest = beast::get_lowest_layer(stream);
  lowest.expires_after(timeout);
  lowest.async_connect(results, [&](beast::error_code e, const tcp::endpoint &) { ec = e; });
  run_until_done(ioc);
  check(ec, "connect", u);

  lowest.expires_after(timeout);
  stream.async_handshake(ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
  run_until_done(ioc);
  check(ec, "tls handshake", u);

  auto res = exchange(ioc, stream, lowest, u, req, timeout);
  lowest.expires_after(timeout);
  stream.async_shutdown([&](beast::error_code e) { ec = e; });
  run_until_done(ioc);
  // eof/short read при закрытии TLS — норма
  return res;
}

} // namespace chunkingest
