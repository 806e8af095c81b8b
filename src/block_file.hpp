#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>
#include "utils.hpp"

struct Block {
  uint64_t offset = 0;
  std::vector<char> data;
  BlockHash hash{};
};

// Length of the block at `offset`: block_size, or the remainder for the last block.
inline std::size_t block_length_at(uint64_t offset, uint64_t device_size, uint64_t block_size) {
  if(offset >= device_size) return 0;
  uint64_t remaining = device_size - offset;
  return static_cast<std::size_t>(remaining < block_size ? remaining : block_size);
}

inline uint64_t block_count(uint64_t device_size, uint64_t block_size) {
  return (device_size + block_size - 1) / block_size;
}

// Forward-only block reader over a device or a plain file (the sync source
// and the base image of a chain).
class BlockFile {
public:
  BlockFile(std::filesystem::path path, uint64_t block_size);

  uint64_t size() const { return size_; }
  uint64_t block_size() const { return block_size_; }
  uint64_t position() const { return position_; }
  bool at_end() const { return position_ >= size_; }
  const std::filesystem::path& path() const { return path_; }

  // Reads and hashes the block at the current position; false at end.
  bool read_block(Block& block);
  // Moves past the current block without reading it.
  void skip_block();

private:
  std::filesystem::path path_;
  uint64_t block_size_;
  std::ifstream in_;
  uint64_t size_ = 0;
  uint64_t position_ = 0;
};
