#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "device.hpp"
#include "event_channel.hpp"
#include "log.hpp"
#include "transfer.hpp"

class HttpClient;

// Published when the local "send_<uuid>" placeholder is replaced by the id
// the receiver assigned in its send-request response.
struct TransferIdChange {
  std::string old_id;
  Transfer transfer;
};

// Outbound transfers: ping, send-request handshake, streamed upload. Every
// step reports through the Transfer it returns and through the progress
// channel; nothing is thrown for network failures.
class FileSender {
public:
  struct Options {
    std::chrono::milliseconds ping_timeout{5000};
    std::chrono::milliseconds handshake_timeout{30000};
    std::chrono::milliseconds chunk_timeout{60000};
    std::chrono::milliseconds response_timeout{std::chrono::minutes(5)};
    int max_attempts = 3;
    std::chrono::milliseconds retry_base_delay{1000};
    uint64_t max_upload_kbps = 0;
    std::size_t chunk_size = 64 * 1024;
  };

  using LocalDeviceProvider = std::function<Device()>;

  FileSender(LocalDeviceProvider local_device,
             Options options,
             std::shared_ptr<Logger> logger = nullptr);

  // relative_path replaces the bare file name on the receiver (folder sends).
  // A null token gets a fresh one that cancel() reaches.
  Transfer send_file(const Device& target,
                     const std::filesystem::path& path,
                     const std::string& relative_path = std::string(),
                     CancellationTokenPtr token = nullptr);

  // Sends every regular file under folder with paths relative to the
  // folder's parent. Throws std::invalid_argument for a missing or empty
  // folder; per-file failures come back as failed transfers.
  std::vector<Transfer> send_folder(const Device& target,
                                    const std::filesystem::path& folder,
                                    CancellationTokenPtr token = nullptr);

  bool ping_device(const Device& target) const;

  // Cancels the send in flight, if any.
  void cancel();

  void set_max_upload_kbps(uint64_t kbps);
  uint64_t max_upload_kbps() const;

  SubscriptionHandle subscribe(EventChannel<Transfer>::Callback callback);
  void unsubscribe(SubscriptionHandle handle);
  SubscriptionHandle subscribe_id_changes(EventChannel<TransferIdChange>::Callback callback);
  void unsubscribe_id_changes(SubscriptionHandle handle);

private:
  struct UploadOutcome {
    Transfer transfer;
    bool retryable = true;
  };

  UploadOutcome attempt_upload(const Device& target,
                               Transfer transfer,
                               const std::filesystem::path& path,
                               CancellationToken& token);

  void emit(const Transfer& transfer);
  Transfer finish_cancelled(Transfer transfer);
  CancellationTokenPtr begin_send(CancellationTokenPtr token);
  std::chrono::milliseconds backoff(int attempt) const;

  LocalDeviceProvider local_device_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  Options options_;
  CancellationTokenPtr active_token_;

  EventChannel<Transfer> progress_;
  EventChannel<TransferIdChange> id_changes_;
};
