#include "multipart.hpp"

#include "utils.hpp"

MultipartEnvelope MultipartEnvelope::for_file(const std::string& field_name,
                                              const std::string& file_name,
                                              std::string boundary) {
  MultipartEnvelope env;
  env.boundary = boundary.empty() ? "anyware-" + hex_from_bytes(random_bytes(12)) : std::move(boundary);
  std::string safe_name;
  for(char c : file_name) {
    if(c == '"' || c == '\r' || c == '\n') safe_name.push_back('_');
    else safe_name.push_back(c);
  }
  env.preamble = "--" + env.boundary + "\r\n"
                 "content-disposition: form-data; name=\"" + field_name + "\"; filename=\"" + safe_name + "\"\r\n"
                 "content-type: application/octet-stream\r\n\r\n";
  env.epilogue = "\r\n--" + env.boundary + "--\r\n";
  return env;
}

std::string MultipartEnvelope::content_type() const {
  return "multipart/form-data; boundary=" + boundary;
}

std::optional<std::string> multipart_boundary(const std::string& content_type) {
  auto lowered = to_lower_ascii(content_type);
  if(lowered.rfind("multipart/form-data", 0) != 0) return std::nullopt;
  auto pos = lowered.find("boundary=");
  if(pos == std::string::npos) return std::nullopt;
  auto value = content_type.substr(pos + 9);
  auto end = value.find(';');
  if(end != std::string::npos) value = value.substr(0, end);
  if(value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  if(value.empty() || value.size() > 200) return std::nullopt;
  return value;
}

MultipartParser::MultipartParser(std::string boundary, Callbacks callbacks)
  : delimiter_("--" + boundary),
    body_delimiter_("\r\n--" + boundary),
    callbacks_(std::move(callbacks)) {}

bool MultipartParser::fail() {
  state_ = State::Failed;
  pending_.clear();
  return false;
}

bool MultipartParser::feed(const char* data, std::size_t size) {
  if(state_ == State::Failed) return false;
  if(state_ == State::Done) return true;
  pending_.append(data, size);
  while(step()) {}
  return state_ != State::Failed;
}

// Consumes as much of pending_ as the current state allows. Returns true
// when progress was made and another step may continue.
bool MultipartParser::step() {
  switch(state_) {
    case State::Preamble: {
      auto pos = pending_.find(delimiter_);
      if(pos == std::string::npos) {
        if(pending_.size() > delimiter_.size()) {
          pending_.erase(0, pending_.size() - delimiter_.size());
        }
        return false;
      }
      pending_.erase(0, pos + delimiter_.size());
      state_ = State::AfterBoundary;
      return true;
    }
    case State::AfterBoundary: {
      if(pending_.size() < 2) return false;
      if(pending_.compare(0, 2, "--") == 0) {
        state_ = State::Done;
        pending_.clear();
        return false;
      }
      if(pending_.compare(0, 2, "\r\n") != 0) return fail();
      pending_.erase(0, 2);
      state_ = State::Headers;
      return true;
    }
    case State::Headers: {
      auto end = pending_.find("\r\n\r\n");
      if(end == std::string::npos) {
        if(pending_.size() > 16 * 1024) return fail();
        return false;
      }
      HttpHeaders headers;
      std::size_t start = 0;
      while(start < end) {
        auto line_end = pending_.find("\r\n", start);
        if(line_end == std::string::npos || line_end > end) line_end = end;
        auto line = pending_.substr(start, line_end - start);
        auto colon = line.find(':');
        if(colon != std::string::npos) {
          auto value = line.substr(colon + 1);
          auto first = value.find_first_not_of(' ');
          headers[to_lower_ascii(line.substr(0, colon))] =
            first == std::string::npos ? std::string() : value.substr(first);
        }
        start = line_end + 2;
      }
      pending_.erase(0, end + 4);
      ++parts_;
      if(callbacks_.on_part_begin && !callbacks_.on_part_begin(headers)) return fail();
      state_ = State::Body;
      return true;
    }
    case State::Body: {
      auto pos = pending_.find(body_delimiter_);
      if(pos == std::string::npos) {
        // keep a tail that could be the start of the delimiter
        if(pending_.size() > body_delimiter_.size()) {
          auto safe = pending_.size() - body_delimiter_.size();
          if(callbacks_.on_data && !callbacks_.on_data(pending_.data(), safe)) return fail();
          pending_.erase(0, safe);
        }
        return false;
      }
      if(pos > 0 && callbacks_.on_data && !callbacks_.on_data(pending_.data(), pos)) return fail();
      pending_.erase(0, pos + body_delimiter_.size());
      if(callbacks_.on_part_end && !callbacks_.on_part_end()) return fail();
      state_ = State::AfterBoundary;
      return true;
    }
    case State::Done:
    case State::Failed:
      return false;
  }
  return false;
}
