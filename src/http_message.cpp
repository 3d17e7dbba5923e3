#include "http_message.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if(begin == std::string::npos) return {};
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::vector<std::string> split_lines(const std::string& head) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while(start < head.size()) {
    auto end = head.find("\r\n", start);
    if(end == std::string::npos) end = head.size();
    lines.push_back(head.substr(start, end - start));
    start = end + 2;
  }
  return lines;
}

bool parse_header_lines(const std::vector<std::string>& lines, HttpHeaders& headers) {
  for(std::size_t i = 1; i < lines.size(); ++i) {
    const auto& line = lines[i];
    if(line.empty()) break;
    auto colon = line.find(':');
    if(colon == std::string::npos || colon == 0) return false;
    headers[to_lower_ascii(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }
  return true;
}

int hex_value(char c) {
  if(c >= '0' && c <= '9') return c - '0';
  if(c >= 'a' && c <= 'f') return c - 'a' + 10;
  if(c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
  auto it = headers.find(to_lower_ascii(name));
  return it == headers.end() ? std::string() : it->second;
}

std::optional<uint64_t> HttpRequest::content_length() const {
  auto value = header("content-length");
  if(value.empty()) return std::nullopt;
  try {
    std::size_t consumed = 0;
    auto parsed = std::stoull(value, &consumed);
    if(consumed != value.size()) return std::nullopt;
    return parsed;
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

HttpResponse HttpResponse::json(int status, const nlohmann::json& body) {
  HttpResponse r;
  r.status = status;
  r.headers["content-type"] = "application/json";
  r.body = body.dump();
  return r;
}

HttpResponse HttpResponse::text(int status, std::string body) {
  HttpResponse r;
  r.status = status;
  r.headers["content-type"] = "text/plain; charset=utf-8";
  r.body = std::move(body);
  return r;
}

std::string HttpResponse::header(const std::string& name) const {
  auto it = headers.find(to_lower_ascii(name));
  return it == headers.end() ? std::string() : it->second;
}

const char* http_reason(int status) {
  switch(status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Unknown";
  }
}

std::string to_lower_ascii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string url_encode(const std::string& value) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for(unsigned char c : value) {
    if(std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

std::string url_decode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for(std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if(c == '%' && i + 2 < value.size()) {
      int hi = hex_value(value[i + 1]);
      int lo = hex_value(value[i + 2]);
      if(hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c == '+' ? ' ' : c);
  }
  return out;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
  std::map<std::string, std::string> out;
  std::size_t start = 0;
  while(start <= query.size()) {
    auto end = query.find('&', start);
    if(end == std::string::npos) end = query.size();
    auto pair = query.substr(start, end - start);
    if(!pair.empty()) {
      auto eq = pair.find('=');
      if(eq == std::string::npos) {
        out[url_decode(pair)] = "";
      } else {
        out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
      }
    }
    start = end + 1;
  }
  return out;
}

std::string build_query(const std::map<std::string, std::string>& params) {
  std::string out;
  for(const auto& [key, value] : params) {
    if(!out.empty()) out.push_back('&');
    // '/' is kept literal by url_encode; query values escape it too
    auto encode = [](const std::string& raw) {
      std::string encoded = url_encode(raw);
      std::string result;
      for(char c : encoded) {
        if(c == '/') result += "%2F";
        else result.push_back(c);
      }
      return result;
    };
    out += encode(key) + "=" + encode(value);
  }
  return out;
}

std::optional<HttpRequest> parse_request_head(const std::string& head) {
  auto lines = split_lines(head);
  if(lines.empty()) return std::nullopt;
  std::istringstream request_line(lines[0]);
  HttpRequest req;
  std::string version;
  if(!(request_line >> req.method >> req.target >> version)) return std::nullopt;
  if(version.rfind("HTTP/1.", 0) != 0) return std::nullopt;
  if(req.target.empty() || req.target[0] != '/') return std::nullopt;
  if(!parse_header_lines(lines, req.headers)) return std::nullopt;

  auto qmark = req.target.find('?');
  if(qmark == std::string::npos) {
    req.path = url_decode(req.target);
  } else {
    req.path = url_decode(req.target.substr(0, qmark));
    req.query = parse_query(req.target.substr(qmark + 1));
  }
  return req;
}

std::optional<HttpResponseHead> parse_response_head(const std::string& head) {
  auto lines = split_lines(head);
  if(lines.empty()) return std::nullopt;
  std::istringstream status_line(lines[0]);
  std::string version;
  HttpResponseHead out;
  if(!(status_line >> version >> out.status)) return std::nullopt;
  if(version.rfind("HTTP/1.", 0) != 0) return std::nullopt;
  if(!parse_header_lines(lines, out.headers)) return std::nullopt;
  return out;
}

std::string serialize_response_head(const HttpResponse& response, std::size_t body_size) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << http_reason(response.status) << "\r\n";
  for(const auto& [name, value] : response.headers) {
    if(name == "content-length" || name == "connection") continue;
    out << name << ": " << value << "\r\n";
  }
  out << "content-length: " << body_size << "\r\n";
  out << "connection: close\r\n\r\n";
  return out.str();
}

std::string serialize_request_head(const std::string& method,
                                   const std::string& target,
                                   const std::string& host,
                                   const HttpHeaders& headers,
                                   std::optional<uint64_t> content_length) {
  std::ostringstream out;
  out << method << " " << target << " HTTP/1.1\r\n";
  out << "host: " << host << "\r\n";
  for(const auto& [name, value] : headers) {
    out << name << ": " << value << "\r\n";
  }
  if(content_length) out << "content-length: " << *content_length << "\r\n";
  out << "connection: close\r\n\r\n";
  return out.str();
}
