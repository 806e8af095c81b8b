#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

// Setting types: bool, int, size (bytes, K/M/G suffixes allowed), string.
inline const nlohmann::json SYNC_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","source_host"},          {"type","string"}, {"default","localhost"}, {"description","[user@]host holding the source device"}, {"persistent", false}},
  {{"key","source_path"},          {"type","string"}, {"default",""},          {"description","Source device or file"}, {"persistent", false}},
  {{"key","destination_host"},     {"type","string"}, {"default","localhost"}, {"description","[user@]host holding the base image"}, {"persistent", false}},
  {{"key","destination_path"},     {"type","string"}, {"default",""},          {"description","Base image the increments are added to"}, {"persistent", false}},
  {{"key","block_size"},           {"aliases", {"b","blocksize"}},  {"type","size"},   {"default",1048576}, {"description","Block size in bytes"}, {"persistent", true}},
  {{"key","comment"},              {"aliases", {"c"}},              {"type","string"}, {"default",""},      {"description","Comment stored in the new increment"}, {"persistent", false}},
  {{"key","identity"},             {"aliases", {"i","id"}},         {"type","string"}, {"default",""},      {"description","ssh identity file for both hosts"}, {"persistent", true}},
  {{"key","identity_source"},      {"aliases", {"id_source"}},      {"type","string"}, {"default",""},      {"description","ssh identity file for the source host"}, {"persistent", true}},
  {{"key","identity_destination"}, {"aliases", {"id_destination"}}, {"type","string"}, {"default",""},      {"description","ssh identity file for the destination host"}, {"persistent", true}},
  {{"key","sudo"},                 {"aliases", {"s"}},              {"type","bool"},   {"default",false},   {"description","Use sudo on both hosts"}, {"persistent", true}},
  {{"key","sudo_source"},          {"type","bool"},   {"default",false},   {"description","Use sudo on the source host"}, {"persistent", true}},
  {{"key","sudo_destination"},     {"type","bool"},   {"default",false},   {"description","Use sudo on the destination host"}, {"persistent", true}},
  {{"key","pause"},                {"aliases", {"p"}},              {"type","int"},    {"default",0},       {"description","Pause between blocks in ms, reduces system load"}, {"persistent", true}},
  {{"key","remote_program"},       {"aliases", {"remote"}},         {"type","string"}, {"default","blocksync-remote"}, {"description","Remote endpoint program"}, {"persistent", true}},
  {{"key","verbose"},              {"aliases", {"v"}},              {"type","bool"},   {"default",false},   {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                 {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},   {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                 {"aliases", {"persist"}},        {"type","bool"},   {"default",false},   {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json REMOTE_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","mode"},     {"type","string"}, {"default",""},    {"description","send | receive"}, {"persistent", false}},
  {{"key","path"},     {"type","string"}, {"default",""},    {"description","Source device (send) or base image (receive)"}, {"persistent", false}},
  {{"key","verbose"},  {"aliases", {"v"}},      {"type","bool"},   {"default",false}, {"description","Enable verbose logging"}, {"persistent", false}},
  {{"key","log_file"}, {"aliases", {"log"}},    {"type","string"}, {"default",""},    {"description","Also write log messages to this file"}, {"persistent", false}},
  {{"key","help"},     {"aliases", {"h","?"}},  {"type","bool"},   {"default",false}, {"description","Show command help and exit"}, {"persistent", false}}
});

inline const nlohmann::json RESTORE_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","increment"},   {"type","string"}, {"default",""},    {"description","Increment <base>.iimgNNN to restore up to"}, {"persistent", false}},
  {{"key","destination"}, {"type","string"}, {"default",""},    {"description","Device or file to write"}, {"persistent", false}},
  {{"key","force"},       {"aliases", {"f"}},      {"type","bool"}, {"default",false}, {"description","Overwrite an existing destination without asking"}, {"persistent", false}},
  {{"key","verbose"},     {"aliases", {"v"}},      {"type","bool"}, {"default",false}, {"description","Enable verbose logging"}, {"persistent", false}},
  {{"key","help"},        {"aliases", {"h","?"}},  {"type","bool"}, {"default",false}, {"description","Show command help and exit"}, {"persistent", false}}
});

class SettingsManager {
public:
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const { return settings_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const { return save_to_file(settings_path()); }
  bool load() { return load_from_file(settings_path()); }
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const { return settings_path_; }
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  nlohmann::json get_json(bool persistent_only = true) const;

  // "4096", "4K", "1M", "2G" -> bytes
  static std::optional<uint64_t> parse_size(const std::string& text);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_ = nlohmann::json::object();
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      for(auto alias : entry.at("aliases").get<std::vector<std::string>>()) {
        spec.aliases.push_back(to_lower(alias));
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  // accept --block-size as well as --block_size
  std::replace(lowered.begin(), lowered.end(), '-', '_');
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) return false;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec || !spec->persistent) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

inline std::optional<uint64_t> SettingsManager::parse_size(const std::string& text) {
  std::string clean = trim_copy(text);
  if(clean.empty()) return std::nullopt;
  uint64_t multiplier = 1;
  switch(std::toupper(static_cast<unsigned char>(clean.back()))) {
    case 'K': multiplier = uint64_t{1} << 10; break;
    case 'M': multiplier = uint64_t{1} << 20; break;
    case 'G': multiplier = uint64_t{1} << 30; break;
    default: break;
  }
  if(multiplier != 1) clean.pop_back();
  if(clean.empty() || clean.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
  try {
    return std::stoull(clean) * multiplier;
  } catch(const std::out_of_range&) {
    return std::nullopt;
  }
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "size") {
    if(value.is_number_unsigned() || (value.is_number_integer() && value.get<int64_t>() >= 0)) {
      settings_[spec.key] = value.get<uint64_t>();
      return true;
    }
    if(value.is_string()) {
      if(auto bytes = parse_size(value.get<std::string>())) {
        settings_[spec.key] = *bytes;
        return true;
      }
    }
    error = "expected a byte count such as 4096, 64K or 1M";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      return std::stoi(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  // size strings are validated by convert_and_store
  return value;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
