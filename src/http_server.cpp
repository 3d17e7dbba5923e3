#include "http_server.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "protocol.hpp"

namespace {

using tcp = asio::ip::tcp;

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket socket, HttpServer& server)
    : socket_(std::move(socket)),
      server_(server),
      head_buffer_(server.options().max_header_bytes),
      idle_timer_(socket_.get_executor()) {}

  void start() {
    std::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if(!ec) remote_address_ = endpoint.address().to_string();
    read_head();
  }

private:
  void arm_idle_timer() {
    auto timeout = server_.options().idle_timeout;
    if(timeout.count() <= 0) return;
    idle_timer_.expires_after(timeout);
    std::weak_ptr<HttpSession> weak = shared_from_this();
    idle_timer_.async_wait([weak](std::error_code ec){
      if(ec) return;
      if(auto self = weak.lock()) self->on_idle();
    });
  }

  void on_idle() {
    timed_out_ = true;
    if(sink_) {
      log_warn(server_.logger().get(), "Upload {} stalled after {} of {} bytes; closing",
               request_.path, received_, expected_);
      finish_stream(false);
    } else {
      log_debug(server_.logger().get(), "Closing idle connection from {}", remote_address_);
    }
    close();
  }

  void read_head() {
    auto self = shared_from_this();
    arm_idle_timer();
    asio::async_read_until(socket_, head_buffer_, "\r\n\r\n",
      [this, self](std::error_code ec, std::size_t bytes){
        if(timed_out_) return;
        if(ec) {
          if(ec == asio::error::not_found) {
            respond(HttpResponse::json(431, make_error_body("Request header too large")));
          }
          return;
        }
        auto begin = asio::buffers_begin(head_buffer_.data());
        std::string head(begin, begin + static_cast<std::ptrdiff_t>(bytes));
        head_buffer_.consume(bytes);
        on_head(head);
      });
  }

  void on_head(const std::string& head) {
    auto parsed = parse_request_head(head);
    if(!parsed) {
      respond(HttpResponse::json(400, make_error_body("Malformed request")));
      return;
    }
    request_ = std::move(*parsed);
    request_.remote_address = remote_address_;
    dispatch_ = server_.dispatch(request_);
    if(dispatch_.response) {
      respond(*dispatch_.response);
      return;
    }
    if(dispatch_.stream_handler) {
      begin_stream();
    } else {
      begin_buffered_body();
    }
  }

  std::string take_leftover(std::size_t limit) {
    auto available = std::min(limit, head_buffer_.size());
    auto begin = asio::buffers_begin(head_buffer_.data());
    std::string out(begin, begin + static_cast<std::ptrdiff_t>(available));
    head_buffer_.consume(available);
    return out;
  }

  void begin_buffered_body() {
    auto length = request_.content_length().value_or(0);
    if(length > server_.options().max_buffered_body) {
      respond(HttpResponse::json(413, make_error_body("Request body too large")));
      return;
    }
    request_.body = take_leftover(static_cast<std::size_t>(length));
    auto have = request_.body.size();
    if(have >= length) {
      run_handler();
      return;
    }
    request_.body.resize(static_cast<std::size_t>(length));
    auto self = shared_from_this();
    arm_idle_timer();
    asio::async_read(socket_,
      asio::buffer(&request_.body[have], static_cast<std::size_t>(length) - have),
      [this, self](std::error_code ec, std::size_t){
        if(timed_out_) return;
        if(ec) {
          log_debug(server_.logger().get(), "Dropped {} {} while reading body: {}",
                    request_.method, request_.path, ec.message());
          return;
        }
        run_handler();
      });
  }

  void run_handler() {
    HttpResponse response;
    try {
      response = (*dispatch_.handler)(request_, dispatch_.params);
    } catch(const std::exception& e) {
      log_error(server_.logger().get(), "{} {} failed: {}", request_.method, request_.path, e.what());
      response = HttpResponse::json(500, make_error_body(e.what()));
    }
    respond(response);
  }

  void begin_stream() {
    StreamStart start;
    try {
      start = (*dispatch_.stream_handler)(request_, dispatch_.params);
    } catch(const std::exception& e) {
      log_error(server_.logger().get(), "{} {} failed: {}", request_.method, request_.path, e.what());
      respond(HttpResponse::json(500, make_error_body(e.what())));
      return;
    }
    if(start.response || !start.sink) {
      respond(start.response ? *start.response
                             : HttpResponse::json(500, make_error_body("No upload handler")));
      return;
    }
    auto length = request_.content_length();
    sink_ = std::move(start.sink);
    if(!length) {
      finish_stream(false);
      respond(HttpResponse::json(411, make_error_body("Content-Length required")));
      return;
    }
    expected_ = *length;
    auto leftover = take_leftover(static_cast<std::size_t>(expected_));
    if(!leftover.empty() && !feed(leftover.data(), leftover.size())) return;
    continue_stream();
  }

  bool feed(const char* data, std::size_t size) {
    bool ok = false;
    try {
      ok = sink_->write(data, size);
    } catch(const std::exception& e) {
      log_error(server_.logger().get(), "Upload sink for {} threw: {}", request_.path, e.what());
    }
    received_ += size;
    if(!ok) {
      respond(finish_stream(false));
      return false;
    }
    return true;
  }

  void continue_stream() {
    if(received_ >= expected_) {
      respond(finish_stream(true));
      return;
    }
    auto want = static_cast<std::size_t>(std::min<uint64_t>(chunk_.size(), expected_ - received_));
    auto self = shared_from_this();
    arm_idle_timer();
    socket_.async_read_some(asio::buffer(chunk_.data(), want),
      [this, self](std::error_code ec, std::size_t bytes){
        if(timed_out_) return;
        if(ec) {
          log_warn(server_.logger().get(), "Connection lost during {} after {} of {} bytes: {}",
                   request_.path, received_, expected_, ec.message());
          finish_stream(false);
          close();
          return;
        }
        if(!feed(chunk_.data(), bytes)) return;
        continue_stream();
      });
  }

  HttpResponse finish_stream(bool complete) {
    if(!sink_) return HttpResponse::json(500, make_error_body("Upload already finished"));
    auto sink = std::move(sink_);
    try {
      return sink->finish(received_, complete);
    } catch(const std::exception& e) {
      log_error(server_.logger().get(), "Finishing upload {} failed: {}", request_.path, e.what());
      return HttpResponse::json(500, make_error_body(e.what()));
    }
  }

  void respond(const HttpResponse& response) {
    auto payload = std::make_shared<std::string>(serialize_response_head(response, response.body.size()));
    payload->append(response.body);
    auto self = shared_from_this();
    arm_idle_timer();
    asio::async_write(socket_, asio::buffer(*payload),
      [this, self, payload](std::error_code, std::size_t){
        close();
      });
  }

  void close() {
    idle_timer_.cancel();
    std::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }

  tcp::socket socket_;
  HttpServer& server_;
  asio::streambuf head_buffer_;
  std::string remote_address_;
  HttpRequest request_;
  HttpServer::Dispatch dispatch_;
  std::shared_ptr<UploadSink> sink_;
  std::array<char, kTransferChunkSize> chunk_{};
  asio::steady_timer idle_timer_;
  bool timed_out_ = false;
  uint64_t expected_ = 0;
  uint64_t received_ = 0;
};

} // namespace

std::vector<std::string> HttpRouter::split_path(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t start = 0;
  while(start < path.size()) {
    auto end = path.find('/', start);
    if(end == std::string::npos) end = path.size();
    if(end > start) segments.push_back(path.substr(start, end - start));
    start = end + 1;
  }
  return segments;
}

void HttpRouter::get(const std::string& pattern, Handler handler) {
  routes_.push_back(Route{"GET", split_path(pattern), std::move(handler), nullptr});
}

void HttpRouter::post(const std::string& pattern, Handler handler) {
  routes_.push_back(Route{"POST", split_path(pattern), std::move(handler), nullptr});
}

void HttpRouter::post_stream(const std::string& pattern, StreamHandler handler) {
  routes_.push_back(Route{"POST", split_path(pattern), nullptr, std::move(handler)});
}

HttpRouter::Match HttpRouter::match(const std::string& method, const std::string& path) const {
  Match result;
  auto segments = split_path(path);
  for(const auto& route : routes_) {
    if(route.segments.size() != segments.size()) continue;
    RouteParams params;
    bool matched = true;
    for(std::size_t i = 0; i < segments.size(); ++i) {
      const auto& expected = route.segments[i];
      if(expected.size() > 2 && expected.front() == '{' && expected.back() == '}') {
        params[expected.substr(1, expected.size() - 2)] = segments[i];
      } else if(expected != segments[i]) {
        matched = false;
        break;
      }
    }
    if(!matched) continue;
    result.path_known = true;
    if(route.method != method) continue;
    result.handler = route.handler ? &route.handler : nullptr;
    result.stream_handler = route.stream_handler ? &route.stream_handler : nullptr;
    result.params = std::move(params);
    return result;
  }
  return result;
}

HttpServer::HttpServer(asio::io_context& io, std::shared_ptr<Logger> logger)
  : HttpServer(io, std::move(logger), Options{}) {}

HttpServer::HttpServer(asio::io_context& io, std::shared_ptr<Logger> logger, Options options)
  : io_(io),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("http")),
    options_(options) {}

HttpServer::~HttpServer() {
  stop();
}

void HttpServer::mount(std::shared_ptr<HttpRouter> router) {
  if(!router) return;
  std::lock_guard<std::mutex> lock(routers_mutex_);
  routers_.push_back(std::move(router));
}

HttpServer::Dispatch HttpServer::dispatch(const HttpRequest& request) const {
  Dispatch out;
  bool path_known = false;
  std::lock_guard<std::mutex> lock(routers_mutex_);
  for(const auto& router : routers_) {
    auto match = router->match(request.method, request.path);
    path_known = path_known || match.path_known;
    if(match.handler || match.stream_handler) {
      out.router = router;
      out.handler = match.handler;
      out.stream_handler = match.stream_handler;
      out.params = std::move(match.params);
      return out;
    }
  }
  out.response = path_known
    ? HttpResponse::json(405, make_error_body("Method not allowed"))
    : HttpResponse::json(404, make_error_body("Not found"));
  return out;
}

uint16_t HttpServer::listen(const std::string& bind_ip, uint16_t port) {
  auto address = asio::ip::make_address(bind_ip.empty() ? "0.0.0.0" : bind_ip);
  tcp::endpoint endpoint(address, port);
  auto acceptor = std::make_unique<tcp::acceptor>(io_);
  acceptor->open(endpoint.protocol());
  acceptor->set_option(tcp::acceptor::reuse_address(true));
  acceptor->bind(endpoint);
  acceptor->listen();
  port_ = acceptor->local_endpoint().port();
  acceptor_ = std::move(acceptor);
  accepting_ = true;
  logger_->info("HTTP server listening on {}:{}", endpoint.address().to_string(), port_);
  start_accept();
  return port_;
}

bool HttpServer::listening() const {
  return acceptor_ && acceptor_->is_open();
}

void HttpServer::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->error("Accept error: {}", ec.message());
        }
      } else {
        std::make_shared<HttpSession>(std::move(socket), *this)->start();
      }
      if(accepting_ && acceptor_ && acceptor_->is_open()) {
        start_accept();
      }
    });
}

void HttpServer::stop() {
  accepting_ = false;
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
}
