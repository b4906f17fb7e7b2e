#include "fleet_core/http_client.hpp"
#include "fleet_core/log.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <cctype>
#include <memory>
#include <utility>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using asio::ip::tcp;

static const char* TAG = "http";

namespace fleet {

namespace {

constexpr uint64_t RESPONSE_BODY_LIMIT = 16 * 1024 * 1024;

// One exchange. The stream deadline is armed once and covers connect, write
// and read together.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(asio::io_context& io, tcp::endpoint endpoint, const HttpRequest& request, HttpHandler handler)
      : stream_(io), endpoint_(std::move(endpoint)), method_(request.method), path_(request.path),
        handler_(std::move(handler)) {
    build_request(request);
    parser_.body_limit(RESPONSE_BODY_LIMIT);
  }

  void start(std::chrono::milliseconds timeout) {
    auto self = shared_from_this();
    stream_.expires_after(timeout);
    stream_.async_connect(endpoint_, [self](const beast::error_code& ec) { self->on_connect(ec); });
  }

private:
  void build_request(const HttpRequest& request) {
    const http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
      req_.method_string(request.method);
    } else {
      req_.method(verb);
    }
    req_.target(request.path);
    req_.version(11);
    req_.set(http::field::host, endpoint_.address().to_string());
    req_.set(http::field::user_agent, "scape-fleet");
    req_.set(http::field::accept, "*/*");
    req_.keep_alive(false);
    if (!request.content_type.empty()) {
      req_.set(http::field::content_type, request.content_type);
    }
    req_.body() = request.body;
    if (!request.body.empty() || verb != http::verb::get) {
      req_.prepare_payload();
    }
  }

  void on_connect(const beast::error_code& ec) {
    if (ec) {
      fail(ec == beast::error::timeout ? FLEET_ERR_TIMEOUT : FLEET_ERR_CONNECT, ec);
      return;
    }
    auto self = shared_from_this();
    http::async_write(stream_, req_, [self](const beast::error_code& wec, std::size_t) { self->on_write(wec); });
  }

  void on_write(const beast::error_code& ec) {
    if (ec) {
      fail(ec == beast::error::timeout ? FLEET_ERR_TIMEOUT : FLEET_ERR_IO, ec);
      return;
    }
    auto self = shared_from_this();
    http::async_read(stream_, buffer_, parser_,
                     [self](const beast::error_code& rec, std::size_t) { self->on_read(rec); });
  }

  // The parser stops at the end of the framed message, so a peer that keeps
  // the connection open does not hold the exchange until the deadline.
  void on_read(const beast::error_code& ec) {
    if (ec) {
      fail(ec == beast::error::timeout ? FLEET_ERR_TIMEOUT : FLEET_ERR_IO, ec);
      return;
    }
    auto& msg = parser_.get();
    HttpResponse resp;
    resp.status = static_cast<int>(msg.result_int());
    resp.body = std::move(msg.body());
    if (resp.status == 200) {
      resp.err = FLEET_OK;
    } else {
      resp.err = FLEET_ERR_HTTP_STATUS;
      resp.error = "HTTP " + std::to_string(resp.status);
    }
    finish(std::move(resp));
  }

  void fail(fleet_err_t err, const beast::error_code& ec) {
    HttpResponse resp;
    resp.err = err;
    resp.error = err == FLEET_ERR_TIMEOUT ? std::string("timeout") : ec.message();
    finish(std::move(resp));
  }

  void finish(HttpResponse resp) {
    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
    stream_.close();
    FLEET_LOGD(TAG, "{} {}{} -> {} ({})", method_, endpoint_.address().to_string(), path_, resp.status,
               fleet_err_to_name(resp.err));
    auto handler = std::move(handler_);
    handler(std::move(resp));
  }

  beast::tcp_stream stream_;
  tcp::endpoint endpoint_;
  std::string method_;
  std::string path_;
  HttpHandler handler_;
  http::request<http::string_body> req_{};
  beast::flat_buffer buffer_{};
  http::response_parser<http::string_body> parser_{};
};

}  // namespace

HttpRequest http_get(const std::string& path) {
  HttpRequest req;
  req.method = "GET";
  req.path = path;
  return req;
}

HttpRequest http_post_json(const std::string& path, const std::string& json) {
  HttpRequest req;
  req.method = "POST";
  req.path = path;
  req.content_type = "application/json";
  req.body = json;
  return req;
}

HttpRequest http_delete_json(const std::string& path, const std::string& json) {
  HttpRequest req = http_post_json(path, json);
  req.method = "DELETE";
  return req;
}

void http_async_request(asio::io_context& io, const std::string& host, uint16_t port, HttpRequest request,
                        std::chrono::milliseconds timeout, HttpHandler handler) {
  boost::system::error_code ec;
  const auto addr = asio::ip::make_address_v4(host, ec);
  if (ec || port == 0) {
    HttpResponse resp;
    resp.err = FLEET_ERR_INVALID_ARG;
    resp.error = "invalid address " + host;
    asio::post(io, [handler = std::move(handler), resp = std::move(resp)]() mutable { handler(std::move(resp)); });
    return;
  }
  auto session = std::make_shared<HttpSession>(io, tcp::endpoint(addr, port), request, std::move(handler));
  session->start(timeout);
}

HttpResponse http_request(const std::string& host, uint16_t port, const HttpRequest& request,
                          std::chrono::milliseconds timeout) {
  asio::io_context io;
  HttpResponse result;
  result.error = "not completed";
  http_async_request(io, host, port, request, timeout, [&result](HttpResponse resp) { result = std::move(resp); });
  io.run();
  return result;
}

std::string http_url_encode(const std::string& text) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size() * 3);
  for (unsigned char ch : text) {
    if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out.push_back(static_cast<char>(ch));
    } else {
      out.push_back('%');
      out.push_back(hex[ch >> 4]);
      out.push_back(hex[ch & 0x0F]);
    }
  }
  return out;
}

}  // namespace fleet
