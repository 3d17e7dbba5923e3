#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "cancellation.hpp"
#include "device.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Client half of the /api/sync/* routes. Calls block and report failures
// through their return values.
class SyncClient {
public:
  struct Options {
    std::chrono::milliseconds ping_timeout{5000};
    std::chrono::milliseconds check_timeout{10000};
    std::chrono::milliseconds delete_timeout{30000};
    std::size_t chunk_size = 64 * 1024;
  };

  using LocalDeviceProvider = std::function<Device()>;

  SyncClient(LocalDeviceProvider local_device, Options options, std::shared_ptr<Logger> logger = nullptr);

  bool ping(const Device& target) const;
  // nullopt when the remote could not be asked.
  std::optional<SyncCheckResult> check(const Device& target, const std::string& relative_path) const;
  // Multipart upload of one file under its forward-slash relative path.
  bool upload(const Device& target,
              const std::filesystem::path& file,
              const std::string& relative_path,
              std::string& error,
              const CancellationTokenPtr& token = nullptr) const;
  bool remove(const Device& target, const std::string& relative_path, std::string& error) const;

  // At least 5 minutes, plus one minute per started 5 MB, plus 5.
  static std::chrono::minutes upload_timeout(uint64_t bytes);

private:
  LocalDeviceProvider local_device_;
  Options options_;
  std::shared_ptr<Logger> logger_;
};
