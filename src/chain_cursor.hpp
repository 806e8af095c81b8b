#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include "block_file.hpp"
#include "increment_file.hpp"
#include "log.hpp"

// Sequential reader over the record stream of one increment file.
// Once the record stream is exhausted the cursor stays at kEnd for good.
class ChainCursor {
public:
  static constexpr uint64_t kEnd = std::numeric_limits<uint64_t>::max();

  ChainCursor(std::filesystem::path path, unsigned sequence, std::shared_ptr<Logger> logger = nullptr);

  ChainCursor(const ChainCursor&) = delete;
  ChainCursor& operator=(const ChainCursor&) = delete;

  uint64_t peek_offset() const { return offset_; }
  bool exhausted() const { return offset_ == kEnd; }
  const BlockHash& current_hash() const { return hash_; }

  // Moves the current record into `block` (offset, data, stored hash) and
  // advances. `length` is the payload size of the block at this offset.
  void take_record(std::size_t length, Block& block);
  // Seeks past the current record's payload; it was superseded by a newer increment.
  void skip_record(std::size_t length);

  const IncrementHeader& header() const { return header_; }
  uint64_t block_size() const { return header_.block_size; }
  unsigned sequence() const { return sequence_; }
  const std::filesystem::path& path() const { return path_; }

private:
  void read_record_header();
  void finish();

  std::filesystem::path path_;
  unsigned sequence_;
  std::ifstream in_;
  IncrementHeader header_;
  uint64_t offset_ = kEnd;
  BlockHash hash_{};
  std::shared_ptr<Logger> logger_;
};

// Reads only the header line of an increment file.
IncrementHeader read_increment_header(const std::filesystem::path& path);
