#include "chain_writer.hpp"
#include "errors.hpp"

namespace {

std::string error_kind(const std::exception& error) {
  if(dynamic_cast<const ChainIntegrityError*>(&error)) return "chain_integrity";
  if(dynamic_cast<const RecordParsingError*>(&error)) return "record_parsing";
  if(dynamic_cast<const VersionMismatch*>(&error)) return "version_mismatch";
  if(dynamic_cast<const IoError*>(&error)) return "io";
  return "internal";
}

} // namespace

void send_writer_refusal(ByteChannel& peer, const std::exception& error) {
  WriterReply reply;
  reply.error_kind = error_kind(error);
  reply.error_message = error.what();
  peer.write_json(make_writer_reply(reply));
}

ChainWriterStats serve_chain_writer(const std::filesystem::path& base_image,
                                    ByteChannel& peer,
                                    std::shared_ptr<Logger> logger) {
  std::unique_ptr<ChainWriter> writer;
  try {
    writer = std::make_unique<ChainWriter>(base_image, peer, std::move(logger));
  } catch(const BlocksyncError& e) {
    send_writer_refusal(peer, e);
    throw;
  }
  return writer->run();
}

ChainWriter::ChainWriter(std::filesystem::path base_image,
                         ByteChannel& peer,
                         std::shared_ptr<Logger> logger)
  : base_image_(std::move(base_image)),
    peer_(peer),
    logger_(std::move(logger)),
    chain_(discover_chain(base_image_)) {
}

ChainWriterStats ChainWriter::run() {
  handshake();
  return stream_blocks();
}

WriterRequest ChainWriter::handshake() {
  auto request = parse_writer_request(peer_.read_json());
  try {
    open_session(request);
  } catch(const BlocksyncError& e) {
    send_writer_refusal(peer_, e);
    throw;
  }
  peer_.write_json(make_writer_reply(WriterReply{}));
  return request;
}

void ChainWriter::open_session(const WriterRequest& request) {
  reader_ = std::make_unique<ChainMergeReader>(chain_, request.block_size, logger_);
  if(reader_->device_size() != request.source_size_bytes) {
    throw ChainIntegrityError("Source size (" + std::to_string(request.source_size_bytes) +
                              ") does not match size of base image '" + base_image_.string() +
                              "' (" + std::to_string(reader_->device_size()) + ")");
  }

  IncrementHeader header;
  header.block_size = request.block_size;
  header.created = local_timestamp();
  header.source_path = request.source_path;
  header.source_identifier = request.source_identifier;
  header.comment = request.comment;
  header.source_size_bytes = request.source_size_bytes;
  increment_ = std::make_unique<IncrementWriter>(chain_.next_increment(), header, logger_);

  log_info(logger_.get(), "writing {} on top of {} existing increments",
           increment_->path().string(), chain_.increments.size());
}

ChainWriterStats ChainWriter::stream_blocks() {
  if(!reader_ || !increment_) {
    throw ProtocolError("chain writer started before handshake");
  }
  ChainWriterStats stats;
  stats.increment = increment_->path();
  Block block;
  while(reader_->next(block)) {
    peer_.write_hash(block.hash);
    auto peer_hash = peer_.read_hash();
    if(blocks_differ(block.hash, peer_hash)) {
      auto data = peer_.read_bytes(block.data.size());
      // the sender's hash is stored as received, not recomputed
      increment_->append(block.offset, peer_hash, data);
      ++stats.changed_blocks;
      log_debug(logger_.get(), "rewrote block {} ({})", block.offset, hex_from_hash(peer_hash));
    }
    ++stats.blocks;
  }
  increment_->seal();
  log_info(logger_.get(), "sealed {}: {} of {} blocks changed",
           stats.increment.string(), stats.changed_blocks, stats.blocks);
  return stats;
}
