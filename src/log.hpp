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

struct LogOptions {
  bool verbose = false;
  // stdout carries the block protocol in the remote endpoints.
  bool stdout_reserved = false;
  std::filesystem::path log_file;
};

void init(const LogOptions& options = LogOptions{});
// Off: messages still reach listeners but no console or file sink.
void set_log_passthrough(bool enabled);

// print and print_err are operator-facing output without timestamp decoration.
enum class LogChannel { info, warn, error, debug, print, print_err };

const char* channel_name(LogChannel channel);
spdlog::level::level_enum channel_level(LogChannel channel);

namespace detail {
void emit(LogChannel channel, const std::string& source, const std::string& message);
} // namespace detail

using LogListenerHandle = std::size_t;

// Named log front end handed to each component. Listeners observe every
// message of this logger; the configured sinks still receive it.
class Logger {
public:
  using Listener = std::function<void(const std::string& source,
                                      LogChannel channel,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  void set_name(std::string name);

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);
  bool has_listeners();

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if(channel == LogChannel::debug && !spdlog::should_log(spdlog::level::debug) && !has_listeners()) return;
    auto message = fmt::format(fmt, std::forward<Args>(args)...);
    notify(channel, message);
    detail::emit(channel, source(), message);
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::print_err, fmt, std::forward<Args>(args)...);
  }

private:
  std::string source();
  void notify(LogChannel channel, const std::string& message);

  std::mutex mutex_;
  std::string name_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
// Through `logger` when given, else straight to the process sinks.
template<typename... Args>
void log_to(Logger* logger, LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->write(channel, fmt, std::forward<Args>(args)...);
    return;
  }
  if(!spdlog::should_log(channel_level(channel))) return;
  emit(channel, std::string(), fmt::format(fmt, std::forward<Args>(args)...));
}
} // namespace detail

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::print_err, fmt, std::forward<Args>(args)...);
}
