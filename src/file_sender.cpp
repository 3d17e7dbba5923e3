#include "file_sender.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

#include "http_client.hpp"
#include "protocol.hpp"
#include "upload_throttle.hpp"
#include "utils.hpp"

namespace {

bool is_client_error(int status) {
  return status >= 400 && status < 500;
}

} // namespace

FileSender::FileSender(LocalDeviceProvider local_device,
                       Options options,
                       std::shared_ptr<Logger> logger)
  : local_device_(std::move(local_device)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("file-sender")),
    options_(options) {
  if(options_.max_attempts < 1) options_.max_attempts = 1;
  if(options_.chunk_size == 0) options_.chunk_size = kTransferChunkSize;
}

bool FileSender::ping_device(const Device& target) const {
  std::chrono::milliseconds timeout;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    timeout = options_.ping_timeout;
  }
  HttpClient client(target.ip, target.port);
  auto result = client.get("/api/ping", timeout);
  if(!result.ok()) {
    logger_->debug("Ping {}:{} failed: {}", target.ip, target.port, result.describe());
  }
  return result.ok();
}

void FileSender::cancel() {
  CancellationTokenPtr token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    token = active_token_;
  }
  if(token) {
    logger_->info("Cancelling active send");
    token->cancel();
  }
}

void FileSender::set_max_upload_kbps(uint64_t kbps) {
  std::lock_guard<std::mutex> lock(mutex_);
  options_.max_upload_kbps = kbps;
}

uint64_t FileSender::max_upload_kbps() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return options_.max_upload_kbps;
}

SubscriptionHandle FileSender::subscribe(EventChannel<Transfer>::Callback callback) {
  return progress_.subscribe(std::move(callback));
}

void FileSender::unsubscribe(SubscriptionHandle handle) {
  progress_.unsubscribe(handle);
}

SubscriptionHandle FileSender::subscribe_id_changes(EventChannel<TransferIdChange>::Callback callback) {
  return id_changes_.subscribe(std::move(callback));
}

void FileSender::unsubscribe_id_changes(SubscriptionHandle handle) {
  id_changes_.unsubscribe(handle);
}

void FileSender::emit(const Transfer& transfer) {
  progress_.publish(transfer);
}

Transfer FileSender::finish_cancelled(Transfer transfer) {
  transfer.status = TransferStatus::Cancelled;
  transfer.error.clear();
  transfer.speed.reset();
  transfer.eta.reset();
  logger_->info("Cancelled {}", transfer.file_name);
  emit(transfer);
  return transfer;
}

CancellationTokenPtr FileSender::begin_send(CancellationTokenPtr token) {
  if(!token) token = CancellationToken::create();
  std::lock_guard<std::mutex> lock(mutex_);
  active_token_ = token;
  return token;
}

std::chrono::milliseconds FileSender::backoff(int attempt) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return options_.retry_base_delay * (1 << (attempt - 1));
}

Transfer FileSender::send_file(const Device& target,
                               const std::filesystem::path& path,
                               const std::string& relative_path,
                               CancellationTokenPtr token) {
  token = begin_send(std::move(token));
  Options options;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    options = options_;
  }
  auto local = local_device_();

  Transfer transfer;
  transfer.id = "send_" + random_uuid();
  transfer.file_name = relative_path.empty() ? path.filename().string() : relative_path;
  transfer.sender = local;
  transfer.receiver = target;
  transfer.status = TransferStatus::Pending;
  transfer.is_sending = true;

  std::error_code ec;
  bool regular = std::filesystem::is_regular_file(path, ec);
  uint64_t size = regular ? std::filesystem::file_size(path, ec) : 0;
  if(!regular || ec) {
    transfer.status = TransferStatus::Failed;
    transfer.error = "File not found: " + path.string();
    logger_->error("{}", transfer.error);
    emit(transfer);
    return transfer;
  }
  transfer.file_size = size;
  emit(transfer);

  if(!ping_device(target)) {
    transfer.status = TransferStatus::Failed;
    transfer.error = "Device is not reachable";
    logger_->warn("{} ({}) is not reachable", target.name, target.ip);
    emit(transfer);
    return transfer;
  }

  SendRequest request;
  request.file_name = transfer.file_name;
  request.file_size = size;
  request.sender_id = local.id;
  request.sender_name = local.name;
  request.sender_ip = local.ip;
  request.sender_port = local.port;
  request.sender_platform = local.platform;
  request.sender_version = local.version;

  std::optional<SendResponse> response;
  std::string last_error;
  for(int attempt = 1; attempt <= options.max_attempts; ++attempt) {
    if(token->cancelled()) return finish_cancelled(transfer);
    HttpClient client(target.ip, target.port);
    CancelScope guard(token.get(), [&client]{ client.abort(); });
    auto result = client.post_json("/api/send-request", request.to_json(), options.handshake_timeout);
    if(token->cancelled()) return finish_cancelled(transfer);
    if(result.ok()) {
      auto doc = result.json();
      if(doc) response = SendResponse::from_json(*doc);
      if(!response) last_error = "invalid send-request response";
      break;
    }
    last_error = result.describe();
    if(result.transport_ok() && is_client_error(result.status)) break;
    if(attempt < options.max_attempts) {
      auto delay = backoff(attempt);
      logger_->warn("Send request attempt {} failed ({}), retrying in {}s",
                    attempt, last_error, std::chrono::duration_cast<std::chrono::seconds>(delay).count());
      if(token->wait_for(delay)) return finish_cancelled(transfer);
    }
  }
  if(!response) {
    transfer.status = TransferStatus::Failed;
    transfer.error = "Could not reach device: " + last_error;
    logger_->error("Send request to {} failed: {}", target.name, last_error);
    emit(transfer);
    return transfer;
  }

  if(!response->transfer_id.empty() && response->transfer_id != transfer.id) {
    auto old_id = transfer.id;
    transfer.id = response->transfer_id;
    id_changes_.publish(TransferIdChange{old_id, transfer});
    emit(transfer);
  }

  if(!response->accepted) {
    transfer.status = TransferStatus::Rejected;
    logger_->info("{} declined {}", target.name, transfer.file_name);
    emit(transfer);
    return transfer;
  }

  transfer.status = TransferStatus::Accepted;
  emit(transfer);
  if(token->cancelled()) return finish_cancelled(transfer);

  transfer.status = TransferStatus::Transferring;
  emit(transfer);

  UploadOutcome outcome{transfer, true};
  for(int attempt = 1; attempt <= options.max_attempts; ++attempt) {
    if(token->cancelled()) return finish_cancelled(transfer);
    outcome = attempt_upload(target, transfer, path, *token);
    if(outcome.transfer.status == TransferStatus::Cancelled) return finish_cancelled(outcome.transfer);
    if(outcome.transfer.status == TransferStatus::Completed) return outcome.transfer;
    if(!outcome.retryable) break;
    if(attempt < options.max_attempts) {
      auto delay = backoff(attempt);
      logger_->warn("Upload attempt {} of {} failed ({}), retrying in {}s",
                    attempt, transfer.file_name, outcome.transfer.error,
                    std::chrono::duration_cast<std::chrono::seconds>(delay).count());
      transfer.error = "Retry " + std::to_string(attempt) + "/" + std::to_string(options.max_attempts) + "...";
      emit(transfer);
      if(token->wait_for(delay)) return finish_cancelled(transfer);
    }
  }

  logger_->error("Sending {} to {} failed: {}", transfer.file_name, target.name, outcome.transfer.error);
  emit(outcome.transfer);
  return outcome.transfer;
}

FileSender::UploadOutcome FileSender::attempt_upload(const Device& target,
                                                      Transfer transfer,
                                                      const std::filesystem::path& path,
                                                      CancellationToken& token) {
  Options options;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    options = options_;
  }
  auto fail = [&](std::string error, bool retryable) {
    transfer.status = TransferStatus::Failed;
    transfer.error = std::move(error);
    transfer.speed.reset();
    transfer.eta.reset();
    emit(transfer);
    return UploadOutcome{transfer, retryable};
  };
  auto cancelled = [&]{
    transfer.status = TransferStatus::Cancelled;
    transfer.speed.reset();
    transfer.eta.reset();
    return UploadOutcome{transfer, false};
  };

  std::ifstream in(path, std::ios::binary);
  if(!in) return fail("Could not open " + path.string(), false);

  HttpClient client(target.ip, target.port);
  CancelScope guard(&token, [&client]{ client.abort(); });
  HttpHeaders headers{{"content-type", "application/octet-stream"}};
  auto ec = client.begin("POST", "/api/upload/" + url_encode(transfer.id), headers,
                         transfer.file_size, options.handshake_timeout);
  if(token.cancelled()) return cancelled();
  if(ec) return fail("Connection lost: " + ec.message(), true);

  UploadThrottle throttle(options.max_upload_kbps * 1024);
  std::vector<char> buffer(options.chunk_size);
  uint64_t sent = 0;
  auto last_chunk = std::chrono::steady_clock::now();

  while(sent < transfer.file_size) {
    if(token.cancelled()) {
      client.abort();
      return cancelled();
    }
    auto want = static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), transfer.file_size - sent));
    in.read(buffer.data(), static_cast<std::streamsize>(want));
    auto got = static_cast<std::size_t>(in.gcount());
    if(got == 0) {
      client.abort();
      return fail("File changed while sending: read " + std::to_string(sent) + " of " +
                  std::to_string(transfer.file_size) + " bytes", false);
    }

    ec = client.write(buffer.data(), got, options.chunk_timeout);
    if(token.cancelled()) return cancelled();
    if(ec) {
      // the receiver may already have answered (403, 500) and closed
      auto early = client.finish(std::chrono::milliseconds(2000));
      if(early.transport_ok() && early.status != 0) {
        return fail(early.describe(), !is_client_error(early.status));
      }
      return fail("Connection lost: " + ec.message(), true);
    }
    sent += got;

    auto now = std::chrono::steady_clock::now();
    auto delay = throttle.account(got, now);
    if(delay.count() > 0) {
      if(token.wait_for(delay)) {
        client.abort();
        return cancelled();
      }
      now = std::chrono::steady_clock::now();
    }

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_chunk).count();
    if(elapsed_ms > 0) {
      double speed = static_cast<double>(got) / static_cast<double>(elapsed_ms) * 1000.0;
      transfer.speed = speed;
      if(speed > 0) {
        auto remaining = static_cast<double>(transfer.file_size - sent);
        transfer.eta = std::chrono::seconds(static_cast<long long>(std::ceil(remaining / speed)));
      }
    }
    last_chunk = now;
    // 1.0 is reported only once the receiver confirms
    if(sent < transfer.file_size) {
      transfer.progress = static_cast<double>(sent) / static_cast<double>(transfer.file_size);
    }
    emit(transfer);
  }

  auto result = client.finish(options.response_timeout);
  if(token.cancelled()) return cancelled();
  if(!result.transport_ok()) {
    if(result.timed_out()) {
      return fail("Transfer timed out: no response within " +
                  std::to_string(std::chrono::duration_cast<std::chrono::seconds>(options.response_timeout).count()) +
                  "s", true);
    }
    return fail("Connection lost: " + result.describe(), true);
  }
  if(result.status != 200) {
    return fail(result.describe(), !is_client_error(result.status));
  }

  transfer.status = TransferStatus::Completed;
  transfer.progress = 1.0;
  transfer.error.clear();
  transfer.eta = std::chrono::seconds(0);
  if(auto doc = result.json(); doc && doc->is_object() && doc->contains("savePath") && (*doc)["savePath"].is_string()) {
    transfer.saved_path = (*doc)["savePath"].get<std::string>();
  }
  logger_->info("Sent {} ({}) to {}", transfer.file_name, format_size(transfer.file_size), target.name);
  emit(transfer);
  return UploadOutcome{transfer, false};
}

std::vector<Transfer> FileSender::send_folder(const Device& target,
                                              const std::filesystem::path& folder,
                                              CancellationTokenPtr token) {
  std::error_code ec;
  if(!std::filesystem::is_directory(folder, ec)) {
    throw std::invalid_argument("Folder not found: " + folder.string());
  }

  std::vector<std::filesystem::path> files;
  for(auto it = std::filesystem::recursive_directory_iterator(folder, ec);
      !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if(it->is_regular_file(ec)) files.push_back(it->path());
  }
  if(ec) {
    throw std::invalid_argument("Could not list " + folder.string() + ": " + ec.message());
  }
  if(files.empty()) {
    throw std::invalid_argument("Folder is empty: " + folder.string());
  }
  std::sort(files.begin(), files.end());

  if(!token) token = CancellationToken::create();
  auto normalized = folder.lexically_normal();
  if(!normalized.has_filename()) normalized = normalized.parent_path();
  auto base = normalized.parent_path();

  std::vector<Transfer> results;
  for(const auto& file : files) {
    if(token->cancelled()) break;
    auto relative = to_portable_path(file.lexically_normal().lexically_relative(base));
    results.push_back(send_file(target, file, relative, token));
  }
  logger_->info("Folder {}: {} of {} files sent", folder.string(),
                std::count_if(results.begin(), results.end(),
                              [](const Transfer& t){ return t.status == TransferStatus::Completed; }),
                files.size());
  return results;
}
