#pragma once
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "log.hpp"
#include "utils.hpp"

// Increment file layout:
//   <JSON header>\n
//   [ <u64 offset, little-endian> <20 byte SHA-1> <block_size bytes, shorter for the device's last block> ]...
// Records carry no length field; the reader derives it from block_size and the device size.

inline constexpr const char* kFormatVersion = "1.0";
inline constexpr const char* kFormatDescription =
  "<this JSON header> \\n [ <8 byte block offset (unsigned 64 bit little-endian)> "
  "<20 bytes block SHA-1 hash> <block_size bytes block of data> ]...";
inline constexpr std::size_t kRecordHeaderLength = 8 + kHashLength;
inline constexpr unsigned kMaxIncrements = 1000;

struct IncrementHeader {
  uint64_t block_size = 0;
  std::string created;
  std::string source_path;
  std::string source_identifier;
  std::string comment;
  uint64_t source_size_bytes = 0;
  std::string format_version = kFormatVersion;
  std::string format_description = kFormatDescription;
};

using RecordHeaderBytes = std::array<unsigned char, kRecordHeaderLength>;

struct RecordHeader {
  uint64_t offset = 0;
  BlockHash hash{};
};

nlohmann::json header_to_json(const IncrementHeader& header);
std::string encode_header_line(const IncrementHeader& header);
// Throws RecordParsingError if the line is not a JSON object or declares a
// non-positive block_size. `origin` names the file in the message.
IncrementHeader parse_header_line(const std::string& line, const std::string& origin);

RecordHeaderBytes encode_record_header(const RecordHeader& record);
RecordHeader decode_record_header(const RecordHeaderBytes& bytes);

std::string local_timestamp();

// <base>.iimgNNN
std::filesystem::path increment_path(const std::filesystem::path& base_image, unsigned sequence);

struct IncrementName {
  std::filesystem::path base_image;
  unsigned sequence = 0;
};
// Throws std::invalid_argument for names without a numeric .iimg extension.
IncrementName parse_increment_path(const std::filesystem::path& path);

// Append-only writer for the one increment a session creates.
class IncrementWriter {
public:
  IncrementWriter(std::filesystem::path path,
                  const IncrementHeader& header,
                  std::shared_ptr<Logger> logger = nullptr);
  ~IncrementWriter();

  IncrementWriter(const IncrementWriter&) = delete;
  IncrementWriter& operator=(const IncrementWriter&) = delete;

  void append(uint64_t offset, const BlockHash& hash, const std::vector<char>& data);
  // Flushes and closes; the file is never reopened for writing.
  void seal();

  const std::filesystem::path& path() const { return path_; }
  uint64_t record_count() const { return record_count_; }
  bool sealed() const { return sealed_; }

private:
  std::filesystem::path path_;
  uint64_t block_size_ = 0;
  std::ofstream out_;
  std::optional<uint64_t> last_offset_;
  uint64_t record_count_ = 0;
  bool sealed_ = false;
  std::shared_ptr<Logger> logger_;
};
