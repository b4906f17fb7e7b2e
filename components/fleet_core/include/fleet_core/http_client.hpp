#pragma once
#include "fleet_core/err.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace fleet {

struct HttpRequest {
  std::string method{"GET"};
  std::string path{"/"};
  std::string content_type{};
  std::string body{};
};

struct HttpResponse {
  fleet_err_t err{FLEET_FAIL};
  int status{0};
  std::string body{};
  std::string error{};

  bool ok() const { return err == FLEET_OK; }
};

using HttpHandler = std::function<void(HttpResponse)>;

HttpRequest http_get(const std::string& path);
HttpRequest http_post_json(const std::string& path, const std::string& json);
HttpRequest http_delete_json(const std::string& path, const std::string& json);

// Queues one HTTP/1.1 exchange on `io`. A single connect attempt is made and
// the whole exchange (connect, write, read) is bounded by `timeout`. The
// handler runs exactly once from within io.run(). Non-200 answers complete
// with FLEET_ERR_HTTP_STATUS and keep the body.
void http_async_request(boost::asio::io_context& io, const std::string& host, uint16_t port,
                        HttpRequest request, std::chrono::milliseconds timeout, HttpHandler handler);

// Runs a single exchange on a private io_context.
HttpResponse http_request(const std::string& host, uint16_t port, const HttpRequest& request,
                          std::chrono::milliseconds timeout);

std::string http_url_encode(const std::string& text);

}  // namespace fleet
