#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "device.hpp"
#include "event_channel.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "protocol.hpp"

struct ClipboardEntry {
  ClipboardKind kind = ClipboardKind::Text;
  std::string text;
  std::string image_path;
  std::string sender_name;
  std::string sender_device_id;
  WallTime timestamp = WallClock::now();

  nlohmann::json to_json() const;
};

// Newest first. An entry with the same text as the newest one within two
// seconds is dropped as a duplicate.
class ClipboardHistory {
public:
  static constexpr std::size_t kMaxEntries = 20;
  static constexpr std::chrono::seconds kDuplicateWindow{2};

  bool add(const ClipboardEntry& entry);
  void clear();
  bool remove_at(std::size_t index);
  std::vector<ClipboardEntry> entries() const;

private:
  mutable std::mutex mutex_;
  std::vector<ClipboardEntry> entries_;
};

// POST /api/clipboard plus the push client. Received entries are published;
// writing them into the desktop clipboard is up to the subscriber.
class ClipboardService {
public:
  struct Options {
    std::chrono::milliseconds text_timeout{10000};
    std::chrono::milliseconds image_timeout{30000};
  };

  using LocalDeviceProvider = std::function<Device()>;
  using DownloadRootProvider = std::function<std::filesystem::path()>;

  ClipboardService(LocalDeviceProvider local_device,
                   DownloadRootProvider download_root,
                   Options options,
                   std::shared_ptr<Logger> logger = nullptr);

  std::shared_ptr<HttpRouter> router();
  HttpResponse handle_clipboard(const HttpRequest& request);

  bool send_text(const Device& target, const std::string& text, std::string& error);
  bool send_image(const Device& target, const std::filesystem::path& image, std::string& error);

  ClipboardHistory& history() { return history_; }

  SubscriptionHandle subscribe(EventChannel<ClipboardEntry>::Callback callback);
  void unsubscribe(SubscriptionHandle handle);

private:
  bool push(const Device& target, const ClipboardMessage& message,
            std::chrono::milliseconds timeout, std::string& error);

  LocalDeviceProvider local_device_;
  DownloadRootProvider download_root_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  ClipboardHistory history_;
  EventChannel<ClipboardEntry> events_;
};
