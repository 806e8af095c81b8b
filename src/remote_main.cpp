#include <cpptrace/cpptrace.hpp>
#include <unistd.h>

#include <filesystem>
#include <memory>
#include <string>

#include "byte_channel.hpp"
#include "chain_writer.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "remote_process.hpp"
#include "settings_manager.hpp"
#include "source_stream.hpp"

namespace {

int run_send(const std::filesystem::path& device, ByteChannel& channel, const std::shared_ptr<Logger>& logger) {
  SourceStream source(device, channel, logger);
  source.run();
  return 0;
}

int run_receive(const std::filesystem::path& base_image, ByteChannel& channel, const std::shared_ptr<Logger>& logger) {
  serve_chain_writer(base_image, channel, logger);
  return 0;
}

} // namespace

int main(int argc, char** argv){
  ignore_sigpipe();
  const std::string process_name = (argc > 0 && argv && argv[0])
    ? std::filesystem::path(argv[0]).filename().string()
    : "blocksync-remote";

  SettingsManager settings(REMOTE_SETTINGS_SPECIFICATION);
  CommandLineParser parser(process_name,
                           "remote endpoint of blocksync, speaks the block protocol on stdin/stdout",
                           REMOTE_SETTINGS_SPECIFICATION,
                           {"mode", "path"});

  // stdout is the protocol stream: everything human-readable goes to stderr
  LogOptions log_options;
  log_options.stdout_reserved = true;
  init(log_options);
  auto logger = std::make_shared<Logger>(process_name);

  try {
    parser.parse(argc, argv, settings);
  } catch(const UsageError& e) {
    logger->print_err("{}", e.what());
    parser.usage();
    return 1;
  }
  if(settings.help_requested()) {
    // print sinks already point at stderr
    parser.usage();
    return 0;
  }

  log_options.verbose = settings.get<bool>("verbose");
  log_options.log_file = settings.get<std::string>("log_file");
  try {
    init(log_options);
  } catch(const spdlog::spdlog_ex& e) {
    logger->print_err("Unable to open log file: {}", e.what());
    return 1;
  }

  const auto mode = settings.get<std::string>("mode");
  const std::filesystem::path path = settings.get<std::string>("path");
  logger->set_name(process_name + ":" + mode);

  try {
    DescriptorChannel channel(STDIN_FILENO, STDOUT_FILENO, "driver");
    if(mode == "send") {
      return run_send(path, channel, logger);
    }
    if(mode == "receive") {
      return run_receive(path, channel, logger);
    }
    logger->print_err("Unknown mode '{}', expected send or receive", mode);
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
