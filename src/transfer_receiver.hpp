#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "device.hpp"
#include "event_channel.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "transfer.hpp"

// Receiving side of the transfer protocol: /api/ping, /api/info,
// /api/send-request, /api/upload/{transferId} and /api/status/{transferId}.
// Uploads stream into "<final>.tmp" and are renamed only after the byte
// count matches the size announced in the send request.
class TransferReceiver {
public:
  struct Options {
    std::filesystem::path download_root;
    bool overwrite = false;
    uint64_t max_file_size = 0;   // bytes, 0 = unlimited
  };

  using AcceptancePolicy = std::function<bool(const Transfer&)>;
  using LocalDeviceProvider = std::function<Device()>;

  TransferReceiver(LocalDeviceProvider local_device,
                   Options options,
                   std::shared_ptr<Logger> logger = nullptr);

  std::shared_ptr<HttpRouter> router();

  // Consulted once per send request. No policy accepts everything; a policy
  // that throws rejects.
  void set_acceptance_policy(AcceptancePolicy policy);
  void set_overwrite(bool overwrite);
  void set_max_file_size(uint64_t bytes);
  void set_download_root(const std::filesystem::path& root);
  std::filesystem::path download_root() const;

  std::optional<Transfer> transfer(const std::string& id) const;
  std::vector<Transfer> transfers() const;

  SubscriptionHandle subscribe(EventChannel<Transfer>::Callback callback);
  void unsubscribe(SubscriptionHandle handle);

  HttpResponse handle_send_request(const HttpRequest& request);
  StreamStart begin_upload(const std::string& transfer_id, const HttpRequest& request);
  HttpResponse handle_status(const std::string& transfer_id) const;

private:
  friend class ReceiverUploadSink;

  // Applies fn to the stored transfer and publishes the result.
  std::optional<Transfer> update(const std::string& id, const std::function<void(Transfer&)>& fn);
  void fail(const std::string& id, const std::string& error);

  LocalDeviceProvider local_device_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  Options options_;
  AcceptancePolicy policy_;
  std::map<std::string, Transfer> transfers_;
  EventChannel<Transfer> events_;
};
