#include <cpptrace/cpptrace.hpp>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "remote_process.hpp"
#include "settings_manager.hpp"
#include "sync_driver.hpp"

namespace {

std::filesystem::path default_settings_path() {
  if(const char* explicit_path = std::getenv("BLOCKSYNC_SETTINGS")) {
    return explicit_path;
  }
  if(const char* home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".config" / "blocksync" / "settings.json";
  }
  return std::filesystem::current_path() / ".config" / "blocksync" / "settings.json";
}

std::string or_default(const std::string& value, const std::string& fallback) {
  return value.empty() ? fallback : value;
}

// Progress line, rewritten in place on a terminal.
class ProgressPrinter {
public:
  ProgressPrinter(std::shared_ptr<Logger> logger, bool interactive)
    : logger_(std::move(logger)), interactive_(interactive) {}

  void operator()(const SyncProgress& p) {
    const double percent = p.total_bytes == 0 ? 100.0 : 100.0 * p.processed_bytes / p.total_bytes;
    auto line = fmt::format("same: {}, diff: {}, {:6.2f} %, {:5.1f} MiB/s, ETR: {} min",
                            p.same_blocks, p.diff_blocks, percent, p.rate_mib_per_second,
                            static_cast<uint64_t>(p.remaining_seconds / 60.0));
    if(interactive_) {
      std::cout << "\r" << line;
      if(line.size() < width_) std::cout << std::string(width_ - line.size(), ' ');
      width_ = std::max(width_, line.size());
      if(p.finished) std::cout << "\n";
      std::cout.flush();
    } else if(p.finished) {
      logger_->print("{}", line);
    }
  }

private:
  std::shared_ptr<Logger> logger_;
  bool interactive_;
  std::size_t width_ = 0;
};

} // namespace

int main(int argc, char** argv){
  ignore_sigpipe();
  auto logger = std::make_shared<Logger>();
  const std::string process_name = (argc > 0 && argv && argv[0])
    ? std::filesystem::path(argv[0]).filename().string()
    : "blocksync";

  SettingsManager settings(SYNC_SETTINGS_SPECIFICATION);
  CommandLineParser parser(process_name,
                           "sync a block device into an incremental image chain",
                           SYNC_SETTINGS_SPECIFICATION,
                           {"source_host", "source_path", "destination_host", "destination_path"});
  try {
    settings.set_settings_path(default_settings_path());
    settings.load();
    parser.parse(argc, argv, settings);
  } catch(const UsageError& e) {
    logger->print_err("{}", e.what());
    parser.usage();
    return 1;
  }
  if(settings.help_requested()) {
    parser.usage();
    return 0;
  }

  LogOptions log_options;
  log_options.verbose = settings.get<bool>("verbose");
  init(log_options);

  if(settings.save_requested() && !settings.save()) {
    logger->error("Unable to persist settings to {}", settings.settings_path().string());
  }

  const uint64_t block_size = settings.get<uint64_t>("block_size");
  const int pause_ms = settings.get<int>("pause");
  if(block_size == 0 || pause_ms < 0) {
    logger->print_err("block_size must be positive and pause must not be negative");
    parser.usage();
    return 1;
  }

  const auto identity = settings.get<std::string>("identity");
  const bool sudo = settings.get<bool>("sudo");

  RemoteCommand source_cmd;
  source_cmd.host = settings.get<std::string>("source_host");
  source_cmd.ssh_identity = or_default(settings.get<std::string>("identity_source"), identity);
  source_cmd.use_sudo = sudo || settings.get<bool>("sudo_source");
  source_cmd.program = settings.get<std::string>("remote_program");
  source_cmd.mode = "send";
  source_cmd.path = settings.get<std::string>("source_path");
  source_cmd.verbose = log_options.verbose;

  RemoteCommand destination_cmd = source_cmd;
  destination_cmd.host = settings.get<std::string>("destination_host");
  destination_cmd.ssh_identity = or_default(settings.get<std::string>("identity_destination"), identity);
  destination_cmd.use_sudo = sudo || settings.get<bool>("sudo_destination");
  destination_cmd.mode = "receive";
  destination_cmd.path = settings.get<std::string>("destination_path");

  std::unique_ptr<RemoteProcess> source;
  std::unique_ptr<RemoteProcess> destination;
  try {
    source = std::make_unique<RemoteProcess>(build_remote_argv(source_cmd), "source", logger);
    destination = std::make_unique<RemoteProcess>(build_remote_argv(destination_cmd), "destination", logger);

    SyncOptions options;
    options.block_size = block_size;
    options.source_path = source_cmd.path;
    options.comment = settings.get<std::string>("comment");
    options.pause = std::chrono::milliseconds(pause_ms);
    options.progress = ProgressPrinter(logger, isatty(STDOUT_FILENO) != 0);

    logger->print("Block size is {:.1f} MiB", static_cast<double>(block_size) / (1024 * 1024));
    if(pause_ms > 0) {
      logger->print("Slowing down for {} ms/block ({:.4f} sec/block)", pause_ms, pause_ms / 1000.0);
    }

    SyncDriver driver(source->channel(), destination->channel(), options, logger);
    auto source_info = driver.handshake_source();
    driver.handshake_destination(source_info);
    logger->print("Starting sync...");
    auto result = driver.transfer(source_info.size);

    const int source_status = source->wait();
    const int destination_status = destination->wait();
    if(source_status != 0 || destination_status != 0) {
      logger->error("remote endpoints finished abnormally: source {}, destination {}",
                    source->exit_description(), destination->exit_description());
      return 1;
    }
    logger->print("");
    logger->print("Completed in {} seconds",
                  std::chrono::duration_cast<std::chrono::seconds>(result.elapsed).count());
    return 0;
  } catch(const PeerDied& e) {
    std::ostringstream status;
    if(source) {
      source->wait();
      status << " [source " << source->exit_description() << "]";
    }
    if(destination) {
      destination->wait();
      status << " [destination " << destination->exit_description() << "]";
    }
    logger->error("Remote host accidentally died: {}{}", e.what(), status.str());
    return 1;
  } catch(const BlocksyncError& e) {
    logger->error("{}", e.what());
    return 1;
  } catch(const std::exception& e) {
    logger->error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
