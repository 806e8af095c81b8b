#include "restore.hpp"

#include <fstream>
#include <system_error>

#include "chain.hpp"
#include "chain_cursor.hpp"
#include "errors.hpp"

namespace {

// Opens every chain member before anything is written, so a bad chain never
// costs the destination its old content.
std::unique_ptr<ChainMergeReader> open_restore_reader(const ChainLayout& chain,
                                                      const std::shared_ptr<Logger>& logger) {
  // every member must agree with the first increment
  const auto block_size = read_increment_header(chain.increments.front()).block_size;
  return std::make_unique<ChainMergeReader>(chain, block_size, logger);
}

RestoreStats stream_chain(ChainMergeReader& reader,
                          const std::filesystem::path& increment,
                          std::ostream& out,
                          const std::shared_ptr<Logger>& logger) {
  RestoreStats stats;
  stats.block_size = reader.block_size();
  stats.increments = reader.increment_count();
  Block block;
  while(reader.next(block)) {
    out.write(block.data.data(), static_cast<std::streamsize>(block.data.size()));
    if(!out) {
      throw IoError("Write failed at offset " + std::to_string(block.offset) + " while restoring '" +
                    increment.string() + "'");
    }
    ++stats.blocks;
    stats.bytes += block.data.size();
  }
  out.flush();
  if(!out) {
    throw IoError("Flush failed while restoring '" + increment.string() + "'");
  }
  log_debug(logger.get(), "restored {} blocks ({} bytes) from {}", stats.blocks, stats.bytes, increment.string());
  return stats;
}

void refuse_chain_member(const ChainLayout& chain, const std::filesystem::path& destination) {
  auto same_file = [&](const std::filesystem::path& member) {
    std::error_code ec;
    // false with ec set when the destination does not exist yet
    return std::filesystem::equivalent(destination, member, ec) && !ec;
  };
  if(same_file(chain.base_image)) {
    throw IoError("Destination '" + destination.string() + "' is the base image of the chain");
  }
  for(const auto& member : chain.increments) {
    if(same_file(member)) {
      throw IoError("Destination '" + destination.string() + "' is increment '" + member.string() + "'");
    }
  }
}

} // namespace

RestoreStats restore_chain(const std::filesystem::path& increment,
                           std::ostream& out,
                           std::shared_ptr<Logger> logger) {
  auto reader = open_restore_reader(chain_up_to(increment), logger);
  return stream_chain(*reader, increment, out, logger);
}

RestoreStats restore_to_path(const std::filesystem::path& increment,
                             const std::filesystem::path& destination,
                             std::shared_ptr<Logger> logger) {
  const auto chain = chain_up_to(increment);
  refuse_chain_member(chain, destination);
  auto reader = open_restore_reader(chain, logger);

  std::ofstream out(destination, std::ios::binary | std::ios::out | std::ios::trunc);
  if(!out) {
    throw IoError("Unable to open '" + destination.string() + "' for writing");
  }
  auto stats = stream_chain(*reader, increment, out, logger);
  out.close();
  if(out.fail()) {
    throw IoError("Unable to close '" + destination.string() + "'");
  }
  return stats;
}
