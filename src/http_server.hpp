#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "http_message.hpp"
#include "log.hpp"

using RouteParams = std::map<std::string, std::string>;

// Receives a request body chunk by chunk. finish() is called exactly once:
// complete=false means the peer went away before Content-Length bytes
// arrived and no response can be delivered.
class UploadSink {
public:
  virtual ~UploadSink() = default;
  virtual bool write(const char* data, std::size_t size) = 0;
  virtual HttpResponse finish(uint64_t received, bool complete) = 0;
};

struct StreamStart {
  std::optional<HttpResponse> response;  // set to answer without reading the body
  std::shared_ptr<UploadSink> sink;
};

class HttpRouter {
public:
  using Handler = std::function<HttpResponse(const HttpRequest&, const RouteParams&)>;
  using StreamHandler = std::function<StreamStart(const HttpRequest&, const RouteParams&)>;

  void get(const std::string& pattern, Handler handler);
  void post(const std::string& pattern, Handler handler);
  void post_stream(const std::string& pattern, StreamHandler handler);

  struct Match {
    const Handler* handler = nullptr;
    const StreamHandler* stream_handler = nullptr;
    RouteParams params;
    bool path_known = false;
  };
  // Patterns are "/api/upload/{transferId}" style; parameters match one segment.
  Match match(const std::string& method, const std::string& path) const;

private:
  struct Route {
    std::string method;
    std::vector<std::string> segments;
    Handler handler;
    StreamHandler stream_handler;
  };
  static std::vector<std::string> split_path(const std::string& path);

  std::vector<Route> routes_;
};

class HttpServer {
public:
  struct Options {
    std::size_t max_header_bytes = 64 * 1024;
    std::size_t max_buffered_body = 256 * 1024 * 1024;
    // A session that makes no read or write progress for this long is
    // closed; an upload in progress is finished as incomplete.
    std::chrono::milliseconds idle_timeout{120000};
  };

  HttpServer(asio::io_context& io, std::shared_ptr<Logger> logger);
  HttpServer(asio::io_context& io, std::shared_ptr<Logger> logger, Options options);
  ~HttpServer();

  void mount(std::shared_ptr<HttpRouter> router);

  // Binds and starts accepting. Port 0 picks an ephemeral port; the bound
  // port is returned. Throws std::system_error when the bind fails.
  uint16_t listen(const std::string& bind_ip, uint16_t port);
  void stop();

  uint16_t port() const { return port_; }
  bool listening() const;

  struct Dispatch {
    std::optional<HttpResponse> response;
    std::shared_ptr<HttpRouter> router;
    const HttpRouter::Handler* handler = nullptr;
    const HttpRouter::StreamHandler* stream_handler = nullptr;
    RouteParams params;
  };
  Dispatch dispatch(const HttpRequest& request) const;

  const Options& options() const { return options_; }
  const std::shared_ptr<Logger>& logger() const { return logger_; }

private:
  using tcp = asio::ip::tcp;

  void start_accept();

  asio::io_context& io_;
  std::shared_ptr<Logger> logger_;
  Options options_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::vector<std::shared_ptr<HttpRouter>> routers_;
  mutable std::mutex routers_mutex_;
  uint16_t port_ = 0;
  bool accepting_ = false;
};
