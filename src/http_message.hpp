#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

// Header names are stored lower-cased.
using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
  std::string method;
  std::string target;
  std::string path;
  std::map<std::string, std::string> query;
  HttpHeaders headers;
  std::string body;
  std::string remote_address;

  std::string header(const std::string& name) const;
  std::optional<uint64_t> content_length() const;
};

struct HttpResponse {
  int status = 200;
  HttpHeaders headers;
  std::string body;

  static HttpResponse json(int status, const nlohmann::json& body);
  static HttpResponse text(int status, std::string body);

  std::string header(const std::string& name) const;
};

const char* http_reason(int status);

std::string to_lower_ascii(std::string value);
std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);
std::map<std::string, std::string> parse_query(const std::string& query);
std::string build_query(const std::map<std::string, std::string>& params);

// Parses "METHOD target HTTP/1.x" plus header lines (up to the blank line).
std::optional<HttpRequest> parse_request_head(const std::string& head);
struct HttpResponseHead {
  int status = 0;
  HttpHeaders headers;
};
std::optional<HttpResponseHead> parse_response_head(const std::string& head);

std::string serialize_response_head(const HttpResponse& response, std::size_t body_size);
std::string serialize_request_head(const std::string& method,
                                   const std::string& target,
                                   const std::string& host,
                                   const HttpHeaders& headers,
                                   std::optional<uint64_t> content_length);
