#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "event_channel.hpp"
#include "http_server.hpp"
#include "log.hpp"

// A mirrored file written or removed on behalf of a remote sync job.
struct SyncActivity {
  enum class Kind { Received, Deleted };
  Kind kind = Kind::Received;
  std::string sender_name;
  std::string relative_path;
  std::filesystem::path path;
  uint64_t size = 0;
};

// Receiving side of folder sync: /api/sync/upload, /api/sync/delete and
// /api/sync/check. Everything lives under <download>/Sync/<sender>/.
class SyncReceiver {
public:
  using DownloadRootProvider = std::function<std::filesystem::path()>;

  explicit SyncReceiver(DownloadRootProvider download_root, std::shared_ptr<Logger> logger = nullptr);

  std::shared_ptr<HttpRouter> router();

  StreamStart begin_upload(const HttpRequest& request);
  HttpResponse handle_delete(const HttpRequest& request);
  HttpResponse handle_check(const HttpRequest& request);

  std::filesystem::path sync_root(const std::string& sender_name) const;
  // Resolves a mirrored path, rejecting unsafe sender names and any relative
  // path that would leave the sender's directory.
  std::optional<std::filesystem::path> resolve(const std::string& sender_name,
                                               const std::string& relative_path,
                                               std::string& error) const;

  SubscriptionHandle subscribe(EventChannel<SyncActivity>::Callback callback);
  void unsubscribe(SubscriptionHandle handle);

private:
  friend class SyncUploadSink;

  DownloadRootProvider download_root_;
  std::shared_ptr<Logger> logger_;
  EventChannel<SyncActivity> events_;
};
