#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class CommandLineParser {
public:
  // positionals: setting keys filled by bare arguments, in order.
  CommandLineParser(std::string process_name,
                    std::string summary,
                    nlohmann::json settings_spec,
                    std::vector<std::string> positionals);

  // Throws UsageError on unknown options, bad values, too many or too few
  // positional arguments (unless help was requested).
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  std::string summary_;
  nlohmann::json settings_spec_;
  std::vector<std::string> positionals_;
};
