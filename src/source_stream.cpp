#include "source_stream.hpp"
#include "errors.hpp"
#include "remote_process.hpp"

std::string lookup_device_identifier(const std::filesystem::path& device) {
  return run_capture({"blkid", device.string()});
}

SourceStream::SourceStream(std::filesystem::path device,
                           ByteChannel& peer,
                           std::shared_ptr<Logger> logger,
                           IdentifierLookup lookup)
  : device_(std::move(device)),
    peer_(peer),
    logger_(std::move(logger)),
    lookup_(std::move(lookup)) {
}

SourceStreamStats SourceStream::run() {
  handshake();
  return stream_blocks();
}

SourceReply SourceStream::handshake() {
  auto request = parse_source_request(peer_.read_json());

  SourceReply reply;
  reply.identifier = lookup_ ? lookup_(device_) : std::string();
  file_ = std::make_unique<BlockFile>(device_, request.block_size);
  reply.size = file_->size();
  peer_.write_json(make_source_reply(reply));

  log_info(logger_.get(), "sending {} ({} bytes, block size {})", device_.string(), reply.size, request.block_size);
  return reply;
}

SourceStreamStats SourceStream::stream_blocks() {
  if(!file_) {
    throw ProtocolError("source stream started before handshake");
  }
  SourceStreamStats stats;
  Block block;
  while(file_->read_block(block)) {
    peer_.write_hash(block.hash);
    auto peer_hash = peer_.read_hash();
    if(blocks_differ(block.hash, peer_hash)) {
      peer_.write_bytes(block.data);
      ++stats.sent_blocks;
      log_debug(logger_.get(), "sent block {} ({} bytes)", block.offset, block.data.size());
    }
    ++stats.blocks;
    stats.bytes_read += block.data.size();
  }
  if(stats.bytes_read != file_->size()) {
    throw IoError("Read " + std::to_string(stats.bytes_read) + " bytes from '" + device_.string() +
                  "', announced " + std::to_string(file_->size()));
  }
  log_info(logger_.get(), "source done: {} blocks, {} sent", stats.blocks, stats.sent_blocks);
  return stats;
}
