#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include "log.hpp"

struct RestoreStats {
  uint64_t blocks = 0;
  uint64_t bytes = 0;
  uint64_t block_size = 0;
  std::size_t increments = 0;
};

// Streams the device content as of `increment` (<base>.iimgNNN): the base
// image overlaid with increments 000..NNN. Nothing in the chain is modified.
RestoreStats restore_chain(const std::filesystem::path& increment,
                           std::ostream& out,
                           std::shared_ptr<Logger> logger = nullptr);

// The whole chain is opened and checked before `destination` is truncated.
// Throws IoError if `destination` is the base image or one of the increments.
RestoreStats restore_to_path(const std::filesystem::path& increment,
                             const std::filesystem::path& destination,
                             std::shared_ptr<Logger> logger = nullptr);
