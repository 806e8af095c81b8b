#include "sync_driver.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <thread>

#include "errors.hpp"

namespace {

[[noreturn]] void raise_refusal(const WriterReply& reply) {
  const std::string message = "destination refused the session: " + reply.error_message;
  if(reply.error_kind == "chain_integrity") throw ChainIntegrityError(message);
  if(reply.error_kind == "record_parsing") throw RecordParsingError(message);
  if(reply.error_kind == "version_mismatch") throw VersionMismatch(message);
  if(reply.error_kind == "io") throw IoError(message);
  throw ProtocolError(message);
}

} // namespace

SyncDriver::SyncDriver(ByteChannel& source,
                       ByteChannel& destination,
                       SyncOptions options,
                       std::shared_ptr<Logger> logger)
  : source_(source),
    destination_(destination),
    options_(std::move(options)),
    logger_(std::move(logger)) {
  if(options_.block_size == 0) {
    throw std::invalid_argument("block size must be positive");
  }
}

SyncResult SyncDriver::run() {
  auto source = handshake_source();
  handshake_destination(source);
  return transfer(source.size);
}

SourceReply SyncDriver::handshake_source() {
  SourceRequest request;
  request.block_size = options_.block_size;
  source_.write_json(make_source_request(request));
  auto reply = parse_source_reply(source_.read_json());
  require_protocol_version("Source", reply.protocol_version);
  log_debug(logger_.get(), "source {} is {} bytes, identifier '{}'",
            options_.source_path, reply.size, reply.identifier);
  return reply;
}

void SyncDriver::handshake_destination(const SourceReply& source) {
  WriterRequest request;
  request.block_size = options_.block_size;
  request.source_path = options_.source_path;
  request.source_identifier = source.identifier;
  request.comment = options_.comment;
  request.source_size_bytes = source.size;
  // A writer that cannot extend its chain answers and exits without reading
  // the request, so a failed write is only fatal once its reply is known.
  std::optional<PeerDied> write_failure;
  try {
    destination_.write_json(make_writer_request(request));
  } catch(const PeerDied& e) {
    write_failure = e;
  }
  auto reply = parse_writer_reply(destination_.read_json());
  if(!reply.error_kind.empty()) {
    raise_refusal(reply);
  }
  if(write_failure) {
    throw *write_failure;
  }
  require_protocol_version("Destination", reply.protocol_version);
}

SyncResult SyncDriver::transfer(uint64_t total_size) {
  SyncResult result;
  result.total_bytes = total_size;
  SyncProgress progress;
  progress.total_bytes = total_size;

  const auto start = std::chrono::steady_clock::now();
  last_report_ = start;
  for(uint64_t offset = 0; offset < total_size; offset += options_.block_size) {
    auto destination_hash = destination_.read_hash();
    auto source_hash = source_.read_hash();

    if(options_.pause.count() > 0) {
      std::this_thread::sleep_for(options_.pause);
    }

    destination_.write_hash(source_hash);
    source_.write_hash(destination_hash);

    const uint64_t current_block_size = std::min<uint64_t>(options_.block_size, total_size - offset);
    if(blocks_differ(source_hash, destination_hash)) {
      auto block = source_.read_bytes(static_cast<std::size_t>(current_block_size));
      destination_.write_bytes(block);
      ++progress.diff_blocks;
    } else {
      ++progress.same_blocks;
    }

    progress.processed_bytes = offset + current_block_size;
    report(progress, start, progress.processed_bytes == total_size);
  }

  result.same_blocks = progress.same_blocks;
  result.diff_blocks = progress.diff_blocks;
  result.elapsed = std::chrono::steady_clock::now() - start;
  log_debug(logger_.get(), "sync finished: same {}, diff {}", result.same_blocks, result.diff_blocks);
  return result;
}

void SyncDriver::report(SyncProgress& progress,
                        std::chrono::steady_clock::time_point start,
                        bool finished) {
  if(!options_.progress) return;
  const auto now = std::chrono::steady_clock::now();
  if(!finished && now - last_report_ < options_.progress_interval) return;
  last_report_ = now;

  progress.finished = finished;
  progress.elapsed_seconds = std::chrono::duration<double>(now - start).count();
  const double done = static_cast<double>(progress.processed_bytes);
  if(progress.elapsed_seconds > 0.0) {
    progress.rate_mib_per_second = done / (1024.0 * 1024.0) / progress.elapsed_seconds;
  }
  if(done > 0.0) {
    progress.remaining_seconds = (static_cast<double>(progress.total_bytes) - done) / done * progress.elapsed_seconds;
  }
  options_.progress(progress);
}
