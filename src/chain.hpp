#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>
#include "block_file.hpp"
#include "chain_cursor.hpp"
#include "log.hpp"

// Base image plus increments in creation order (index == sequence number).
struct ChainLayout {
  std::filesystem::path base_image;
  std::vector<std::filesystem::path> increments;

  std::filesystem::path next_increment() const;
};

// Collects <base>.iimg000, .iimg001, ... up to the first missing number.
// Throws ChainIntegrityError when all kMaxIncrements already exist.
ChainLayout discover_chain(const std::filesystem::path& base_image);

// The chain truncated at the given increment file: increments 000..NNN.
// Throws std::invalid_argument for a badly named file, IoError if a member is missing.
ChainLayout chain_up_to(const std::filesystem::path& increment);

// Overlays every increment of a chain on its base image and yields the
// current content block by block in increasing offset order. The newest
// increment holding an offset wins; older records for it are skipped.
class ChainMergeReader {
public:
  // Throws ChainIntegrityError if any increment disagrees with block_size.
  ChainMergeReader(const ChainLayout& chain, uint64_t block_size, std::shared_ptr<Logger> logger = nullptr);

  bool next(Block& block);

  uint64_t block_size() const { return block_size_; }
  uint64_t device_size() const { return base_.size(); }
  uint64_t position() const { return base_.position(); }
  std::size_t increment_count() const { return cursors_.size(); }

private:
  void report_leftovers();

  uint64_t block_size_;
  std::shared_ptr<Logger> logger_;
  // newest first
  std::vector<std::unique_ptr<ChainCursor>> cursors_;
  BlockFile base_;
  bool finished_ = false;
};
