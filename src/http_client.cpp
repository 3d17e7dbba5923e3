#include "http_client.hpp"

#include <functional>
#include <optional>

std::optional<nlohmann::json> HttpResult::json() const {
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if(parsed.is_discarded()) return std::nullopt;
  return parsed;
}

std::string HttpResult::describe() const {
  if(error) {
    if(timed_out()) return "request timed out";
    return error.message();
  }
  std::string text = "Server responded with " + std::to_string(status);
  if(auto doc = json(); doc && doc->is_object() && doc->contains("error") && (*doc)["error"].is_string()) {
    text += ": " + (*doc)["error"].get<std::string>();
  } else if(!body.empty() && body.size() < 256) {
    text += ": " + body;
  }
  return text;
}

HttpClient::HttpClient(std::string host, uint16_t port)
  : host_(std::move(host)), port_(port), socket_(io_) {}

HttpClient::~HttpClient() {
  close();
}

template<typename Start>
std::error_code HttpClient::run_until(Start start, std::chrono::milliseconds timeout) {
  if(aborted_) return asio::error::operation_aborted;
  std::optional<std::error_code> result;
  start([&result](std::error_code ec){ result = ec; });
  io_.restart();
  if(!aborted_) {
    io_.run_for(timeout);
  }
  if(!result) {
    std::error_code ignored;
    socket_.close(ignored);
    io_.restart();
    io_.run();
    return aborted_ ? asio::error::operation_aborted : asio::error::timed_out;
  }
  if(aborted_) return asio::error::operation_aborted;
  return *result;
}

std::error_code HttpClient::connect(std::chrono::milliseconds timeout) {
  close();
  std::error_code ec;
  auto address = asio::ip::make_address(host_, ec);
  std::vector<tcp::endpoint> endpoints;
  if(!ec) {
    endpoints.emplace_back(address, port_);
  } else {
    tcp::resolver resolver(io_);
    auto results = resolver.resolve(host_, std::to_string(port_), ec);
    if(ec) return ec;
    for(const auto& entry : results) endpoints.push_back(entry.endpoint());
  }
  return run_until([&](auto done){
    asio::async_connect(socket_, endpoints,
      [done](std::error_code connect_ec, const tcp::endpoint&){ done(connect_ec); });
  }, timeout);
}

std::error_code HttpClient::begin(const std::string& method,
                                  const std::string& target,
                                  const HttpHeaders& headers,
                                  uint64_t content_length,
                                  std::chrono::milliseconds timeout) {
  auto deadline = Clock::now() + timeout;
  if(auto ec = connect(timeout)) return ec;
  auto head = serialize_request_head(method, target, host_ + ":" + std::to_string(port_),
                                     headers, content_length);
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  if(remaining.count() <= 0) return asio::error::timed_out;
  return run_until([&](auto done){
    asio::async_write(socket_, asio::buffer(head),
      [done](std::error_code write_ec, std::size_t){ done(write_ec); });
  }, remaining);
}

std::error_code HttpClient::write(const char* data, std::size_t size, std::chrono::milliseconds timeout) {
  if(size == 0) return {};
  return run_until([&](auto done){
    asio::async_write(socket_, asio::buffer(data, size),
      [done](std::error_code write_ec, std::size_t){ done(write_ec); });
  }, timeout);
}

HttpResult HttpClient::finish(std::chrono::milliseconds timeout) {
  auto result = read_response(timeout);
  close();
  return result;
}

HttpResult HttpClient::read_response(std::chrono::milliseconds timeout) {
  HttpResult result;
  auto deadline = Clock::now() + timeout;
  auto remaining = [&]{
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  };

  asio::streambuf buffer;
  std::size_t head_bytes = 0;
  result.error = run_until([&](auto done){
    asio::async_read_until(socket_, buffer, "\r\n\r\n",
      [done, &head_bytes](std::error_code ec, std::size_t n){
        head_bytes = n;
        done(ec);
      });
  }, timeout);
  if(result.error) return result;

  auto begin = asio::buffers_begin(buffer.data());
  std::string head(begin, begin + static_cast<std::ptrdiff_t>(head_bytes));
  buffer.consume(head_bytes);
  auto parsed = parse_response_head(head);
  if(!parsed) {
    result.error = asio::error::invalid_argument;
    return result;
  }
  result.status = parsed->status;
  result.headers = std::move(parsed->headers);

  auto begin_body = asio::buffers_begin(buffer.data());
  result.body.assign(begin_body, begin_body + static_cast<std::ptrdiff_t>(buffer.size()));
  buffer.consume(buffer.size());

  std::optional<std::size_t> length;
  if(auto it = result.headers.find("content-length"); it != result.headers.end()) {
    try {
      length = static_cast<std::size_t>(std::stoull(it->second));
    } catch(const std::exception&) {
      result.error = asio::error::invalid_argument;
      return result;
    }
  }

  if(length) {
    if(result.body.size() >= *length) {
      result.body.resize(*length);
      return result;
    }
    auto have = result.body.size();
    result.body.resize(*length);
    auto left = remaining();
    if(left.count() <= 0) {
      result.error = asio::error::timed_out;
      return result;
    }
    result.error = run_until([&](auto done){
      asio::async_read(socket_, asio::buffer(&result.body[have], *length - have),
        [done](std::error_code ec, std::size_t){ done(ec); });
    }, left);
    return result;
  }

  // no Content-Length: the body runs until the server closes
  std::string rest;
  auto left = remaining();
  if(left.count() <= 0) {
    result.error = asio::error::timed_out;
    return result;
  }
  auto ec = run_until([&](auto done){
    asio::async_read(socket_, asio::dynamic_buffer(rest),
      [done](std::error_code read_ec, std::size_t){ done(read_ec); });
  }, left);
  if(ec && ec != asio::error::eof) {
    result.error = ec;
    return result;
  }
  result.body += rest;
  return result;
}

HttpResult HttpClient::request(const std::string& method,
                               const std::string& target,
                               const HttpHeaders& headers,
                               const std::string& body,
                               std::chrono::milliseconds timeout) {
  HttpResult result;
  auto deadline = Clock::now() + timeout;
  std::optional<uint64_t> length;
  if(method != "GET" || !body.empty()) length = body.size();
  HttpHeaders merged = headers;

  auto remaining = [&]{
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  };

  if(auto ec = connect(timeout)) {
    result.error = ec;
    close();
    return result;
  }
  auto payload = serialize_request_head(method, target, host_ + ":" + std::to_string(port_),
                                        merged, length);
  payload += body;
  auto left = remaining();
  if(left.count() <= 0) {
    result.error = asio::error::timed_out;
    close();
    return result;
  }
  result.error = run_until([&](auto done){
    asio::async_write(socket_, asio::buffer(payload),
      [done](std::error_code ec, std::size_t){ done(ec); });
  }, left);
  if(result.error) {
    close();
    return result;
  }
  left = remaining();
  if(left.count() <= 0) {
    result.error = asio::error::timed_out;
    close();
    return result;
  }
  result = read_response(left);
  close();
  return result;
}

HttpResult HttpClient::get(const std::string& target, std::chrono::milliseconds timeout) {
  return request("GET", target, {}, {}, timeout);
}

HttpResult HttpClient::post_json(const std::string& target,
                                 const nlohmann::json& body,
                                 std::chrono::milliseconds timeout) {
  return request("POST", target, {{"content-type", "application/json"}}, body.dump(), timeout);
}

void HttpClient::abort() {
  aborted_ = true;
  io_.stop();
}

void HttpClient::close() {
  std::error_code ec;
  if(socket_.is_open()) {
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }
}
