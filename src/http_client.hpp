#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "http_message.hpp"

struct HttpResult {
  int status = 0;
  HttpHeaders headers;
  std::string body;
  std::error_code error;

  bool transport_ok() const { return !error; }
  bool ok() const { return !error && status >= 200 && status < 300; }
  bool timed_out() const { return error == asio::error::timed_out; }
  bool aborted() const { return error == asio::error::operation_aborted; }
  std::optional<nlohmann::json> json() const;
  // "Server responded with 404: ..." or the transport error text.
  std::string describe() const;
};

// Blocking HTTP/1.1 client over a private io_context. Every call takes its own
// deadline. abort() may be called from any thread and makes the in-flight
// call return with operation_aborted.
class HttpClient {
public:
  using Clock = std::chrono::steady_clock;

  HttpClient(std::string host, uint16_t port);
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  HttpResult get(const std::string& target, std::chrono::milliseconds timeout);
  HttpResult post_json(const std::string& target,
                       const nlohmann::json& body,
                       std::chrono::milliseconds timeout);
  HttpResult request(const std::string& method,
                     const std::string& target,
                     const HttpHeaders& headers,
                     const std::string& body,
                     std::chrono::milliseconds timeout);

  // Streaming request body: begin() connects and sends the head, write()
  // sends body bytes, finish() reads the response. Each step has its own
  // deadline.
  std::error_code begin(const std::string& method,
                        const std::string& target,
                        const HttpHeaders& headers,
                        uint64_t content_length,
                        std::chrono::milliseconds timeout);
  std::error_code write(const char* data, std::size_t size, std::chrono::milliseconds timeout);
  HttpResult finish(std::chrono::milliseconds timeout);

  void abort();
  void close();

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

private:
  using tcp = asio::ip::tcp;

  template<typename Start>
  std::error_code run_until(Start start, std::chrono::milliseconds timeout);

  std::error_code connect(std::chrono::milliseconds timeout);
  HttpResult read_response(std::chrono::milliseconds timeout);

  std::string host_;
  uint16_t port_ = 0;
  asio::io_context io_;
  tcp::socket socket_;
  std::atomic<bool> aborted_{false};
};
