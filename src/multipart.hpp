#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "http_message.hpp"

// multipart/form-data with a single file part, as the sync upload uses it.
struct MultipartEnvelope {
  std::string boundary;
  std::string preamble;   // boundary line and part headers
  std::string epilogue;   // closing boundary

  static MultipartEnvelope for_file(const std::string& field_name,
                                    const std::string& file_name,
                                    std::string boundary = std::string());
  std::string content_type() const;
  uint64_t total_size(uint64_t file_size) const { return preamble.size() + file_size + epilogue.size(); }
};

std::optional<std::string> multipart_boundary(const std::string& content_type);

// Incremental multipart/form-data parser. Feed arbitrary slices of the body;
// part data is delivered through on_data between on_part_begin and on_part_end.
class MultipartParser {
public:
  struct Callbacks {
    std::function<bool(const HttpHeaders& headers)> on_part_begin;
    std::function<bool(const char* data, std::size_t size)> on_data;
    std::function<bool()> on_part_end;
  };

  MultipartParser(std::string boundary, Callbacks callbacks);

  // Returns false on malformed input or when a callback asked to stop.
  bool feed(const char* data, std::size_t size);
  bool done() const { return state_ == State::Done; }
  bool failed() const { return state_ == State::Failed; }
  std::size_t parts() const { return parts_; }

private:
  enum class State { Preamble, Headers, Body, AfterBoundary, Done, Failed };

  bool step();
  bool fail();

  std::string delimiter_;     // "--boundary"
  std::string body_delimiter_; // "\r\n--boundary"
  Callbacks callbacks_;
  std::string pending_;
  State state_ = State::Preamble;
  std::size_t parts_ = 0;
};
