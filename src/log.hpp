#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Configures the shared sinks. Safe to call more than once; the last call wins
// for the level and the optional log file.
void init(bool verbose = false);
bool set_log_file(const std::filesystem::path& path);
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

enum class LogChannel {
  Info,
  Warn,
  Error,
  Debug,
  Print,
  PrintErr
};

const char* log_channel_name(LogChannel channel);

namespace detail {
spdlog::level::level_enum channel_level(LogChannel channel);
} // namespace detail

class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  void set_name(std::string name);
  std::string name() const;

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();
  std::size_t listener_count() const;

  // Listeners registered on the parent also see everything logged here.
  void set_parent(std::shared_ptr<Logger> parent);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  // Console output meant for the user; not filtered by verbosity.
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

  void write(LogChannel channel,
             spdlog::level::level_enum level,
             const std::string& message);

private:
  template<typename... Args>
  void log(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(channel, detail::channel_level(channel), fmt::format(fmt, std::forward<Args>(args)...));
  }

  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  mutable std::mutex mutex_;
  std::string name_;
  std::shared_ptr<Logger> parent_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void emit_to_sinks(LogChannel channel,
                   const std::string& channel_name,
                   spdlog::level::level_enum level,
                   const std::string& message);
} // namespace detail

// Routes through `logger` (and its listeners) when one is given, otherwise
// straight to the shared sinks.
template<typename... Args>
inline void log_to(Logger* logger,
                   LogChannel channel,
                   spdlog::format_string_t<Args...> fmt,
                   Args&&... args) {
  auto level = detail::channel_level(channel);
  if(logger) {
    logger->write(channel, level, fmt::format(fmt, std::forward<Args>(args)...));
    return;
  }
  detail::emit_to_sinks(channel, log_channel_name(channel), level,
                        fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
