#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {
constexpr const char* kDecoratedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kPlainPattern = "%v";

struct ProcessLoggers {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::mutex g_loggers_mutex;
ProcessLoggers g_loggers;
std::atomic<bool> g_log_passthrough{true};

spdlog::sink_ptr make_console_sink(bool to_stderr, const char* pattern) {
  spdlog::sink_ptr sink;
  if(to_stderr) {
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  sink->set_pattern(pattern);
  return sink;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr console,
                                            const spdlog::sink_ptr& file_sink,
                                            spdlog::level::level_enum flush_level) {
  std::vector<spdlog::sink_ptr> sinks{std::move(console)};
  if(file_sink) sinks.push_back(file_sink);
  spdlog::drop(name);
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

// Caller holds g_loggers_mutex.
void build_loggers(const LogOptions& options) {
  const bool out_to_stderr = options.stdout_reserved;

  spdlog::sink_ptr file_sink;
  if(!options.log_file.empty()) {
    file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file.string());
    file_sink->set_pattern(kDecoratedPattern);
  }

  g_loggers.info = make_logger("blocksync.info", make_console_sink(out_to_stderr, kDecoratedPattern),
                               file_sink, spdlog::level::warn);
  g_loggers.error = make_logger("blocksync.error", make_console_sink(true, kDecoratedPattern),
                                file_sink, spdlog::level::err);
  g_loggers.print = make_logger("blocksync.print", make_console_sink(out_to_stderr, kPlainPattern),
                                file_sink, spdlog::level::info);
  g_loggers.print_err = make_logger("blocksync.print_err", make_console_sink(true, kPlainPattern),
                                    file_sink, spdlog::level::err);
}

spdlog::logger* sink_for(LogChannel channel) {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  if(!g_loggers.info) build_loggers(LogOptions{});
  switch(channel) {
    case LogChannel::print: return g_loggers.print.get();
    case LogChannel::print_err: return g_loggers.print_err.get();
    case LogChannel::error: return g_loggers.error.get();
    default: return g_loggers.info.get();
  }
}

} // namespace

void init(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  build_loggers(options);

  auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  g_loggers.info->set_level(level);
  g_loggers.error->set_level(spdlog::level::info);
  g_loggers.print->set_level(spdlog::level::info);
  g_loggers.print_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_loggers.info);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::info: return "info";
    case LogChannel::warn: return "warn";
    case LogChannel::error: return "error";
    case LogChannel::debug: return "debug";
    case LogChannel::print: return "print";
    case LogChannel::print_err: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::warn: return spdlog::level::warn;
    case LogChannel::error:
    case LogChannel::print_err: return spdlog::level::err;
    case LogChannel::debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(mutex_);
  name_ = std::move(name);
}

std::string Logger::source() {
  std::lock_guard<std::mutex> lock(mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

bool Logger::has_listeners() {
  std::lock_guard<std::mutex> lock(mutex_);
  return !listeners_.empty();
}

void Logger::notify(LogChannel channel, const std::string& message) {
  std::vector<Listener> snapshot;
  std::string name;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(listeners_.empty()) return;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
    name = name_;
  }
  for(auto& listener : snapshot) {
    listener(name, channel, message);
  }
}

namespace detail {

void emit(LogChannel channel, const std::string& source, const std::string& message) {
  auto* sink = sink_for(channel);
  if(!g_log_passthrough.load(std::memory_order_acquire)) return;

  const auto level = channel_level(channel);
  const bool plain = channel == LogChannel::print || channel == LogChannel::print_err;
  if(!plain && !source.empty()) {
    sink->log(level, fmt::format("[{}] {}", source, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
