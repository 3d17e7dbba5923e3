#include "directory_watcher.hpp"

#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_CLOSE_WRITE | IN_MODIFY | IN_MOVED_TO |
                                IN_MOVED_FROM | IN_DELETE | IN_DELETE_SELF;

} // namespace

const char* to_string(WatchEventType type) {
  switch(type) {
    case WatchEventType::Added: return "added";
    case WatchEventType::Modified: return "modified";
    case WatchEventType::Removed: return "removed";
  }
  return "modified";
}

DirectoryWatcher::DirectoryWatcher(std::filesystem::path root, Callback callback, std::shared_ptr<Logger> logger)
  : root_(std::move(root)),
    callback_(std::move(callback)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("watcher")) {}

DirectoryWatcher::~DirectoryWatcher() {
  stop();
}

bool DirectoryWatcher::start(std::string& error) {
  if(running_) return true;
  std::error_code ec;
  if(!std::filesystem::is_directory(root_, ec)) {
    error = "Directory does not exist: " + root_.string();
    return false;
  }
  fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if(fd_ < 0) {
    error = std::string("inotify_init1 failed: ") + std::strerror(errno);
    return false;
  }
  if(!add_watch(root_)) {
    error = "Cannot watch " + root_.string() + ": " + std::strerror(errno);
    ::close(fd_);
    fd_ = -1;
    return false;
  }
  add_tree(root_, false);
  running_ = true;
  thread_ = std::thread([this]{ run_loop(); });
  logger_->debug("Watching {} ({} directories)", root_.string(), watch_count());
  return true;
}

void DirectoryWatcher::stop() {
  running_ = false;
  if(thread_.joinable()) thread_.join();
  if(fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  watches_.clear();
}

std::size_t DirectoryWatcher::watch_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return watches_.size();
}

bool DirectoryWatcher::add_watch(const std::filesystem::path& dir) {
  int wd = inotify_add_watch(fd_, dir.c_str(), kWatchMask);
  if(wd < 0) return false;
  std::lock_guard<std::mutex> lock(mutex_);
  watches_[wd] = dir;
  return true;
}

void DirectoryWatcher::add_tree(const std::filesystem::path& dir, bool report_files) {
  std::error_code ec;
  for(auto it = std::filesystem::recursive_directory_iterator(dir, ec);
      !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if(it->is_directory(type_ec)) {
      if(!add_watch(it->path())) {
        logger_->warn("Cannot watch {}: {}", it->path().string(), std::strerror(errno));
      }
    } else if(report_files && it->is_regular_file(type_ec)) {
      emit(WatchEventType::Added, it->path(), false);
    }
  }
  if(ec) logger_->warn("Listing {} failed: {}", dir.string(), ec.message());
}

void DirectoryWatcher::emit(WatchEventType type, const std::filesystem::path& path, bool is_directory) {
  if(!callback_) return;
  try {
    callback_(WatchEvent{type, path, is_directory});
  } catch(const std::exception& e) {
    logger_->error("Watch callback failed for {}: {}", path.string(), e.what());
  }
}

void DirectoryWatcher::handle_event(int wd, uint32_t mask, const std::string& name) {
  if(mask & IN_Q_OVERFLOW) {
    logger_->warn("Event queue overflow under {}; some changes were missed", root_.string());
    return;
  }

  std::filesystem::path dir;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = watches_.find(wd);
    if(it == watches_.end()) return;
    dir = it->second;
    if(mask & IN_IGNORED) {
      watches_.erase(it);
      return;
    }
  }
  if(mask & IN_DELETE_SELF) return;
  if(name.empty()) return;

  auto path = dir / name;
  bool is_dir = (mask & IN_ISDIR) != 0;

  if(mask & (IN_DELETE | IN_MOVED_FROM)) {
    emit(WatchEventType::Removed, path, is_dir);
    return;
  }
  if(is_dir) {
    if(mask & (IN_CREATE | IN_MOVED_TO)) {
      if(!add_watch(path)) {
        logger_->warn("Cannot watch {}: {}", path.string(), std::strerror(errno));
      }
      add_tree(path, true);
    }
    return;
  }
  if(mask & (IN_CREATE | IN_MOVED_TO)) {
    emit(WatchEventType::Added, path, false);
  } else if(mask & (IN_CLOSE_WRITE | IN_MODIFY)) {
    emit(WatchEventType::Modified, path, false);
  }
}

void DirectoryWatcher::run_loop() {
  std::vector<char> buffer(64 * 1024);
  while(running_) {
    pollfd pfd{fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, 200);
    if(ready < 0) {
      if(errno == EINTR) continue;
      logger_->error("poll on watcher failed: {}", std::strerror(errno));
      break;
    }
    if(ready == 0) continue;

    ssize_t len = ::read(fd_, buffer.data(), buffer.size());
    if(len <= 0) continue;
    std::size_t offset = 0;
    while(offset < static_cast<std::size_t>(len)) {
      auto* event = reinterpret_cast<inotify_event*>(buffer.data() + offset);
      std::string name = event->len ? std::string(event->name) : std::string();
      handle_event(event->wd, event->mask, name);
      offset += sizeof(inotify_event) + event->len;
    }
  }
}
