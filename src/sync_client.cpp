#include "sync_client.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <vector>

#include "http_client.hpp"
#include "multipart.hpp"

SyncClient::SyncClient(LocalDeviceProvider local_device, Options options, std::shared_ptr<Logger> logger)
  : local_device_(std::move(local_device)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync-client")) {
  if(options_.chunk_size == 0) options_.chunk_size = kTransferChunkSize;
}

std::chrono::minutes SyncClient::upload_timeout(uint64_t bytes) {
  double megabytes = static_cast<double>(bytes) / (1024.0 * 1024.0);
  auto minutes = static_cast<long long>(std::ceil(megabytes / 5.0)) + 5;
  return std::chrono::minutes(std::max<long long>(5, minutes));
}

bool SyncClient::ping(const Device& target) const {
  HttpClient client(target.ip, target.port);
  auto result = client.get("/api/ping", options_.ping_timeout);
  if(!result.ok()) {
    logger_->warn("Ping failed for {}: {}", target.name, result.describe());
  }
  return result.ok();
}

std::optional<SyncCheckResult> SyncClient::check(const Device& target, const std::string& relative_path) const {
  auto local = local_device_();
  auto target_path = "/api/sync/check?" + build_query({{"path", relative_path}, {"sender", local.name}});
  HttpClient client(target.ip, target.port);
  auto result = client.get(target_path, options_.check_timeout);
  if(!result.ok()) {
    logger_->warn("Check file status failed for {}: {}", relative_path, result.describe());
    return std::nullopt;
  }
  auto doc = result.json();
  if(!doc) return std::nullopt;
  return SyncCheckResult::from_json(*doc);
}

bool SyncClient::upload(const Device& target,
                        const std::filesystem::path& file,
                        const std::string& relative_path,
                        std::string& error,
                        const CancellationTokenPtr& token) const {
  std::error_code ec;
  auto size = std::filesystem::file_size(file, ec);
  if(ec) {
    error = "File does not exist: " + file.string();
    return false;
  }
  std::ifstream in(file, std::ios::binary);
  if(!in) {
    error = "Cannot open " + file.string();
    return false;
  }

  auto local = local_device_();
  auto envelope = MultipartEnvelope::for_file("file", file.filename().string());
  HttpHeaders headers{
    {"content-type", envelope.content_type()},
    {to_lower_ascii(kSyncPathHeader), url_encode(relative_path)},
    {to_lower_ascii(kDeviceIdHeader), local.id},
    {to_lower_ascii(kDeviceNameHeader), url_encode(local.name)}
  };
  std::chrono::milliseconds timeout = upload_timeout(size);
  auto deadline = HttpClient::Clock::now() + timeout;
  auto remaining = [&]{
    return std::max(std::chrono::milliseconds(1),
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - HttpClient::Clock::now()));
  };

  HttpClient client(target.ip, target.port);
  CancelScope abort_on_cancel(token.get(), [&client]{ client.abort(); });

  if(auto begin_ec = client.begin("POST", "/api/sync/upload", headers, envelope.total_size(size), remaining())) {
    error = begin_ec.message();
    return false;
  }
  if(auto write_ec = client.write(envelope.preamble.data(), envelope.preamble.size(), remaining())) {
    error = write_ec.message();
    return false;
  }
  std::vector<char> buffer(options_.chunk_size);
  uint64_t sent = 0;
  while(sent < size) {
    auto want = static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), size - sent));
    in.read(buffer.data(), static_cast<std::streamsize>(want));
    auto got = static_cast<std::size_t>(in.gcount());
    if(got == 0) {
      client.abort();
      error = "File changed while uploading: " + file.string();
      return false;
    }
    if(auto write_ec = client.write(buffer.data(), got, remaining())) {
      error = write_ec.message();
      return false;
    }
    sent += got;
  }
  if(auto write_ec = client.write(envelope.epilogue.data(), envelope.epilogue.size(), remaining())) {
    error = write_ec.message();
    return false;
  }

  auto result = client.finish(remaining());
  if(!result.ok()) {
    error = result.transport_ok() ? "HTTP " + std::to_string(result.status) + ": " + result.body
                                  : result.describe();
    logger_->warn("Failed to sync {}: {}", relative_path, error);
    return false;
  }
  return true;
}

bool SyncClient::remove(const Device& target, const std::string& relative_path, std::string& error) const {
  auto local = local_device_();
  SyncDeleteRequest request;
  request.relative_path = relative_path;
  request.sender_name = local.name;
  request.sender_device_id = local.id;

  HttpClient client(target.ip, target.port);
  auto result = client.post_json("/api/sync/delete", request.to_json(), options_.delete_timeout);
  if(!result.ok()) {
    error = result.describe();
    logger_->warn("Failed to delete {} on {}: {}", relative_path, target.name, error);
    return false;
  }
  logger_->info("Deleted {} on {}", relative_path, target.name);
  return true;
}
