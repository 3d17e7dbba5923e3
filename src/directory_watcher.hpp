#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "log.hpp"

enum class WatchEventType { Added, Modified, Removed };

const char* to_string(WatchEventType type);

struct WatchEvent {
  WatchEventType type = WatchEventType::Modified;
  std::filesystem::path path;
  bool is_directory = false;
};

// Recursive inotify watcher. New subdirectories are watched as they appear
// and files already inside them are reported as Added. Callbacks run on the
// watcher thread.
class DirectoryWatcher {
public:
  using Callback = std::function<void(const WatchEvent&)>;

  DirectoryWatcher(std::filesystem::path root, Callback callback, std::shared_ptr<Logger> logger = nullptr);
  ~DirectoryWatcher();

  DirectoryWatcher(const DirectoryWatcher&) = delete;
  DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

  bool start(std::string& error);
  void stop();
  bool running() const { return running_; }

  const std::filesystem::path& root() const { return root_; }
  std::size_t watch_count() const;

private:
  void run_loop();
  bool add_watch(const std::filesystem::path& dir);
  void add_tree(const std::filesystem::path& dir, bool report_files);
  void handle_event(int wd, uint32_t mask, const std::string& name);
  void emit(WatchEventType type, const std::filesystem::path& path, bool is_directory);

  std::filesystem::path root_;
  Callback callback_;
  std::shared_ptr<Logger> logger_;

  int fd_ = -1;
  std::atomic<bool> running_{false};
  std::thread thread_;
  mutable std::mutex mutex_;
  std::map<int, std::filesystem::path> watches_;
};
