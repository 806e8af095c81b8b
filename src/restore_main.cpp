#include <cpptrace/cpptrace.hpp>
#include <readline/readline.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "restore.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

// Asks until the answer is yes or no; end of input counts as no.
bool query_yes_no(const std::string& question) {
  rl_outstream = stderr;
  const std::string prompt = question + " [y/n] ";
  for(;;) {
    char* raw = readline(prompt.c_str());
    if(!raw) return false;
    std::string answer = to_lower(trim_copy(raw));
    std::free(raw);
    if(answer == "y" || answer == "ye" || answer == "yes") return true;
    if(answer == "n" || answer == "no") return false;
    std::fputs("Please respond with 'yes' or 'no' (or 'y' or 'n').\n", stderr);
  }
}

} // namespace

int main(int argc, char** argv){
  auto logger = std::make_shared<Logger>();
  const std::string process_name = (argc > 0 && argv && argv[0])
    ? std::filesystem::path(argv[0]).filename().string()
    : "blocksync-restore";

  SettingsManager settings(RESTORE_SETTINGS_SPECIFICATION);
  CommandLineParser parser(process_name,
                           "merge a base image and its increments up to <increment> into <destination>",
                           RESTORE_SETTINGS_SPECIFICATION,
                           {"increment", "destination"});
  try {
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

  const std::filesystem::path increment = settings.get<std::string>("increment");
  const std::filesystem::path destination = settings.get<std::string>("destination");

  try {
    if(std::filesystem::is_regular_file(destination) && !settings.get<bool>("force")) {
      if(!query_yes_no(process_name + ": overwrite '" + destination.string() + "'?")) {
        return 0;
      }
    }
    auto stats = restore_to_path(increment, destination, logger);
    logger->info("restored {} bytes from base image and {} increments (block size {})",
                 stats.bytes, stats.increments, stats.block_size);
    return 0;
  } catch(const std::invalid_argument& e) {
    logger->error("{}", e.what());
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
