#include "increment_file.hpp"

#include <spdlog/fmt/chrono.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

#include "errors.hpp"

namespace {

std::string quoted_header(const std::string& line) {
  return sanitize_string(line, 300);
}

} // namespace

nlohmann::json header_to_json(const IncrementHeader& header) {
  nlohmann::json j;
  j["block_size"] = header.block_size;
  j["created"] = header.created;
  j["source_path"] = header.source_path;
  j["source_identifier"] = header.source_identifier;
  j["comment"] = header.comment;
  j["source_size_bytes"] = header.source_size_bytes;
  j["format_version"] = header.format_version;
  j["file_format"] = header.format_description;
  return j;
}

std::string encode_header_line(const IncrementHeader& header) {
  // dump() escapes control characters, so the header never spans lines
  return header_to_json(header).dump() + "\n";
}

IncrementHeader parse_header_line(const std::string& line, const std::string& origin) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(line);
  } catch(const nlohmann::json::exception&) {
    throw RecordParsingError("Could not parse header (" + quoted_header(line) +
                             ") of '" + origin + "' (JSON error)");
  }
  if(!j.is_object() || !j.contains("block_size") || !j.at("block_size").is_number_integer()) {
    throw RecordParsingError("Could not parse header (" + quoted_header(line) +
                             ") of '" + origin + "' (missing block_size)");
  }
  auto declared = j.at("block_size").get<int64_t>();
  if(declared <= 0) {
    throw RecordParsingError("Non-positive block size " + std::to_string(declared) +
                             " in '" + origin + "'");
  }

  IncrementHeader header;
  header.block_size = static_cast<uint64_t>(declared);
  header.created = j.value("created", "");
  header.source_path = j.value("source_path", "");
  header.source_identifier = j.value("source_identifier", "");
  header.comment = j.value("comment", "");
  header.source_size_bytes = j.value("source_size_bytes", uint64_t{0});
  header.format_version = j.value("format_version", "");
  header.format_description = j.value("file_format", "");
  return header;
}

RecordHeaderBytes encode_record_header(const RecordHeader& record) {
  RecordHeaderBytes out{};
  for(std::size_t i = 0; i < 8; ++i) {
    out[i] = static_cast<unsigned char>((record.offset >> (8 * i)) & 0xff);
  }
  std::copy(record.hash.begin(), record.hash.end(), out.begin() + 8);
  return out;
}

RecordHeader decode_record_header(const RecordHeaderBytes& bytes) {
  RecordHeader record;
  for(std::size_t i = 0; i < 8; ++i) {
    record.offset |= static_cast<uint64_t>(bytes[i]) << (8 * i);
  }
  std::copy(bytes.begin() + 8, bytes.end(), record.hash.begin());
  return record;
}

std::string local_timestamp() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  return fmt::format("{:%Y-%m-%dT%H:%M:%S%z}", fmt::localtime(now));
}

std::filesystem::path increment_path(const std::filesystem::path& base_image, unsigned sequence) {
  char suffix[16];
  std::snprintf(suffix, sizeof(suffix), ".iimg%03u", sequence);
  return std::filesystem::path(base_image.string() + suffix);
}

IncrementName parse_increment_path(const std::filesystem::path& path) {
  const std::string extension = path.extension().string();
  if(extension.rfind(".iimg", 0) != 0) {
    throw std::invalid_argument("increment filename extension must start with '.iimg', is '" + extension + "'");
  }
  const std::string digits = extension.substr(5);
  if(digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("increment filename extension must end with the increment number: '" +
                                path.string() + "'");
  }
  IncrementName name;
  name.sequence = static_cast<unsigned>(std::stoul(digits));
  if(name.sequence >= kMaxIncrements) {
    throw std::invalid_argument("increment number " + digits + " exceeds " +
                                std::to_string(kMaxIncrements - 1));
  }
  name.base_image = path;
  name.base_image.replace_extension();
  return name;
}

IncrementWriter::IncrementWriter(std::filesystem::path path,
                                 const IncrementHeader& header,
                                 std::shared_ptr<Logger> logger)
  : path_(std::move(path)),
    block_size_(header.block_size),
    logger_(std::move(logger)) {
  if(std::filesystem::exists(path_)) {
    throw IoError("Refusing to overwrite existing increment '" + path_.string() + "'");
  }
  out_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
  if(!out_) {
    throw IoError("Unable to create increment '" + path_.string() + "'");
  }
  const auto line = encode_header_line(header);
  out_.write(line.data(), static_cast<std::streamsize>(line.size()));
  if(!out_) {
    throw IoError("Unable to write header of '" + path_.string() + "'");
  }
  log_debug(logger_.get(), "created increment {}", path_.string());
}

IncrementWriter::~IncrementWriter() {
  if(!sealed_ && out_.is_open()) {
    log_warn(logger_.get(), "increment {} closed without being sealed; treat it as corrupt", path_.string());
  }
}

void IncrementWriter::append(uint64_t offset, const BlockHash& hash, const std::vector<char>& data) {
  if(sealed_) {
    throw IoError("Increment '" + path_.string() + "' is sealed");
  }
  if(last_offset_ && offset <= *last_offset_) {
    throw IoError("Record offset " + std::to_string(offset) + " not after " +
                  std::to_string(*last_offset_) + " in '" + path_.string() + "'");
  }
  if(data.size() > block_size_ || offset % block_size_ != 0) {
    throw IoError("Record at offset " + std::to_string(offset) + " with " +
                  std::to_string(data.size()) + " bytes does not fit block size " +
                  std::to_string(block_size_));
  }
  const auto header = encode_record_header(RecordHeader{offset, hash});
  out_.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
  out_.write(data.data(), static_cast<std::streamsize>(data.size()));
  if(!out_) {
    throw IoError("Write failed at offset " + std::to_string(offset) + " in '" + path_.string() + "'");
  }
  last_offset_ = offset;
  ++record_count_;
}

void IncrementWriter::seal() {
  if(sealed_) return;
  out_.flush();
  out_.close();
  if(out_.fail()) {
    throw IoError("Unable to close increment '" + path_.string() + "'");
  }
  sealed_ = true;
  log_debug(logger_.get(), "sealed increment {} with {} records", path_.string(), record_count_);
}
