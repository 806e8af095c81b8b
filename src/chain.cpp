#include "chain.hpp"
#include <algorithm>
#include <stdexcept>
#include "errors.hpp"

std::filesystem::path ChainLayout::next_increment() const {
  return increment_path(base_image, static_cast<unsigned>(increments.size()));
}

ChainLayout discover_chain(const std::filesystem::path& base_image) {
  ChainLayout chain;
  chain.base_image = base_image;
  for(unsigned sequence = 0; sequence < kMaxIncrements; ++sequence) {
    auto candidate = increment_path(base_image, sequence);
    if(!std::filesystem::is_regular_file(candidate)) return chain;
    chain.increments.push_back(std::move(candidate));
  }
  throw ChainIntegrityError("Can not make more than " + std::to_string(kMaxIncrements) +
                            " incremental images of '" + base_image.string() + "'");
}

ChainLayout chain_up_to(const std::filesystem::path& increment) {
  auto name = parse_increment_path(increment);
  ChainLayout chain;
  chain.base_image = name.base_image;
  for(unsigned sequence = 0; sequence <= name.sequence; ++sequence) {
    auto member = increment_path(name.base_image, sequence);
    if(!std::filesystem::is_regular_file(member)) {
      throw IoError("Increment '" + member.string() + "' of the chain does not exist");
    }
    chain.increments.push_back(std::move(member));
  }
  return chain;
}

namespace {

std::vector<std::unique_ptr<ChainCursor>> open_cursors(const ChainLayout& chain,
                                                       uint64_t block_size,
                                                       const std::shared_ptr<Logger>& logger) {
  if(chain.increments.size() > kMaxIncrements) {
    throw ChainIntegrityError("Chain of '" + chain.base_image.string() + "' has more than " +
                              std::to_string(kMaxIncrements) + " increments");
  }
  std::vector<std::unique_ptr<ChainCursor>> cursors;
  cursors.reserve(chain.increments.size());
  for(std::size_t i = 0; i < chain.increments.size(); ++i) {
    auto cursor = std::make_unique<ChainCursor>(chain.increments[i], static_cast<unsigned>(i), logger);
    if(cursor->block_size() != block_size) {
      throw ChainIntegrityError("Block size (" + std::to_string(cursor->block_size()) + ") in '" +
                                chain.increments[i].string() + "' does not match expected (" +
                                std::to_string(block_size) + ").");
    }
    cursors.push_back(std::move(cursor));
  }
  // latest increment first so the first match is the most recent write
  std::reverse(cursors.begin(), cursors.end());
  return cursors;
}

} // namespace

ChainMergeReader::ChainMergeReader(const ChainLayout& chain, uint64_t block_size, std::shared_ptr<Logger> logger)
  : block_size_(block_size),
    logger_(std::move(logger)),
    cursors_(open_cursors(chain, block_size, logger_)),
    base_(chain.base_image, block_size) {
}

bool ChainMergeReader::next(Block& block) {
  if(finished_) return false;
  const uint64_t offset = base_.position();
  const std::size_t length = block_length_at(offset, base_.size(), block_size_);
  if(length == 0) {
    finished_ = true;
    report_leftovers();
    return false;
  }

  bool found = false;
  for(auto& cursor : cursors_) {
    const uint64_t peek = cursor->peek_offset();
    if(peek == ChainCursor::kEnd || peek > offset) continue;
    if(peek < offset) {
      throw RecordParsingError("Record at offset " + std::to_string(peek) + " in '" + cursor->path().string() +
                               "' is not aligned to block size " + std::to_string(block_size_));
    }
    if(!found) {
      log_debug(logger_.get(), "use block {} from increment {:03}", offset, cursor->sequence());
      cursor->take_record(length, block);
      found = true;
    } else {
      log_debug(logger_.get(), "skip stale block {} in increment {:03}", offset, cursor->sequence());
      cursor->skip_record(length);
    }
  }

  if(found) {
    // keep the base image in lockstep with the merged stream
    base_.skip_block();
    return true;
  }
  log_debug(logger_.get(), "use block {} from base image", offset);
  return base_.read_block(block);
}

void ChainMergeReader::report_leftovers() {
  for(const auto& cursor : cursors_) {
    if(!cursor->exhausted()) {
      log_warn(logger_.get(), "increment {} holds records beyond device end (next offset {}); ignored",
               cursor->path().string(), cursor->peek_offset());
    }
  }
}
