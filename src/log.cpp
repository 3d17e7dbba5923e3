#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

struct SinkRegistry {
  std::mutex mutex;
  std::shared_ptr<spdlog::logger> stamped_out;
  std::shared_ptr<spdlog::logger> stamped_err;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
  spdlog::level::level_enum level = spdlog::level::info;
};

SinkRegistry& registry() {
  static SinkRegistry instance;
  return instance;
}

std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr console,
                                            const std::shared_ptr<spdlog::sinks::basic_file_sink_mt>& file) {
  std::vector<spdlog::sink_ptr> sinks{std::move(console)};
  if(file) sinks.push_back(file);
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  return logger;
}

void rebuild_locked(SinkRegistry& reg) {
  auto stamped_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  stamped_out_sink->set_pattern(kStampedPattern);
  auto stamped_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  stamped_err_sink->set_pattern(kStampedPattern);
  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");
  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  // CLI output stays off the log file; only the stamped channels are persisted.
  reg.stamped_out = make_logger("anyware.out", stamped_out_sink, reg.file_sink);
  reg.stamped_err = make_logger("anyware.err", stamped_err_sink, reg.file_sink);
  reg.plain_out = make_logger("anyware.print", plain_out_sink, nullptr);
  reg.plain_err = make_logger("anyware.print_err", plain_err_sink, nullptr);

  reg.stamped_out->set_level(reg.level);
  reg.stamped_err->set_level(spdlog::level::info);
  reg.plain_out->set_level(spdlog::level::info);
  reg.plain_err->set_level(spdlog::level::info);

  reg.stamped_out->flush_on(spdlog::level::warn);
  reg.stamped_err->flush_on(spdlog::level::err);
  reg.plain_out->flush_on(spdlog::level::info);
  reg.plain_err->flush_on(spdlog::level::err);
}

std::shared_ptr<spdlog::logger> sink_for(LogChannel channel) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if(!reg.stamped_out) rebuild_locked(reg);
  switch(channel) {
    case LogChannel::Print: return reg.plain_out;
    case LogChannel::PrintErr: return reg.plain_err;
    case LogChannel::Error: return reg.stamped_err;
    default: return reg.stamped_out;
  }
}

} // namespace

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

void init(bool verbose) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  reg.level = verbose ? spdlog::level::debug : spdlog::level::info;
  rebuild_locked(reg);
  spdlog::set_level(reg.level);
}

bool set_log_file(const std::filesystem::path& path) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if(path.empty()) {
    reg.file_sink.reset();
    rebuild_locked(reg);
    return true;
  }
  try {
    if(path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(path.parent_path(), ec);
    }
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
    sink->set_pattern(kFilePattern);
    reg.file_sink = std::move(sink);
  } catch(const spdlog::spdlog_ex& e) {
    if(!reg.stamped_err) rebuild_locked(reg);
    reg.stamped_err->error("Unable to open log file {}: {}", path.string(), e.what());
    return false;
  }
  rebuild_locked(reg);
  return true;
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return name_;
}

void Logger::set_parent(std::shared_ptr<Logger> parent) {
  std::lock_guard<std::mutex> lock(mutex_);
  parent_ = std::move(parent);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.clear();
}

std::size_t Logger::listener_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

void Logger::write(LogChannel channel,
                   spdlog::level::level_enum level,
                   const std::string& message) {
  std::string name = this->name();
  std::string channel_name = name.empty()
    ? std::string(log_channel_name(channel))
    : name + ":" + log_channel_name(channel);
  if(dispatch(channel_name, level, message)) return;
  detail::emit_to_sinks(channel, channel_name, level, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  std::shared_ptr<Logger> parent;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
    parent = parent_;
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_sinks(LogChannel::Error, channel, spdlog::level::err,
                            fmt::format("log listener threw: {}", e.what()));
    }
  }
  if(parent && parent->dispatch(channel, level, message)) {
    handled = true;
  }
  return handled;
}

namespace detail {

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void emit_to_sinks(LogChannel channel,
                   const std::string& channel_name,
                   spdlog::level::level_enum level,
                   const std::string& message) {
  if(!log_passthrough()) return;
  auto sink = sink_for(channel);
  if(!sink) return;
  if(!channel_name.empty() && channel_name != log_channel_name(channel)) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
