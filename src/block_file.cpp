#include "block_file.hpp"
#include "errors.hpp"

BlockFile::BlockFile(std::filesystem::path path, uint64_t block_size)
  : path_(std::move(path)), block_size_(block_size) {
  if(block_size_ == 0) {
    throw IoError("Block size must be positive for '" + path_.string() + "'");
  }
  in_.open(path_, std::ios::binary | std::ios::in);
  if(!in_) {
    throw IoError("Unable to open '" + path_.string() + "' for reading");
  }
  // seeking to the end also sizes block devices
  in_.seekg(0, std::ios::end);
  auto end = in_.tellg();
  if(end < 0) {
    throw IoError("Unable to determine size of '" + path_.string() + "'");
  }
  size_ = static_cast<uint64_t>(end);
  in_.seekg(0, std::ios::beg);
}

bool BlockFile::read_block(Block& block) {
  const std::size_t length = block_length_at(position_, size_, block_size_);
  if(length == 0) return false;
  block.offset = position_;
  block.data.resize(length);
  in_.read(block.data.data(), static_cast<std::streamsize>(length));
  if(static_cast<std::size_t>(in_.gcount()) != length) {
    throw IoError("Short read in '" + path_.string() + "' at offset " + std::to_string(position_) +
                  ": expected " + std::to_string(length) + " bytes, got " + std::to_string(in_.gcount()));
  }
  block.hash = sha1_block(block.data);
  position_ += length;
  return true;
}

void BlockFile::skip_block() {
  const std::size_t length = block_length_at(position_, size_, block_size_);
  if(length == 0) return;
  in_.seekg(static_cast<std::streamoff>(length), std::ios::cur);
  if(!in_) {
    throw IoError("Seek failed in '" + path_.string() + "' at offset " + std::to_string(position_));
  }
  position_ += length;
}
