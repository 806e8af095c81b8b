#pragma once
#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include "byte_channel.hpp"
#include "chain.hpp"
#include "increment_file.hpp"
#include "log.hpp"
#include "protocol.hpp"

struct ChainWriterStats {
  uint64_t blocks = 0;
  uint64_t changed_blocks = 0;
  std::filesystem::path increment;
};

// Receiving endpoint: walks the merged chain, exchanges hashes with the peer
// and appends every block the peer replaces to a new increment.
class ChainWriter {
public:
  // Discovers the chain; throws ChainIntegrityError when it is already full,
  // before anything is read from or written to the peer.
  ChainWriter(std::filesystem::path base_image,
              ByteChannel& peer,
              std::shared_ptr<Logger> logger = nullptr);

  ChainWriterStats run();

  WriterRequest handshake();
  ChainWriterStats stream_blocks();

private:
  void open_session(const WriterRequest& request);

  std::filesystem::path base_image_;
  ByteChannel& peer_;
  std::shared_ptr<Logger> logger_;
  ChainLayout chain_;
  std::unique_ptr<ChainMergeReader> reader_;
  std::unique_ptr<IncrementWriter> increment_;
};

// Tells the driver why the session was refused, as the handshake reply.
void send_writer_refusal(ByteChannel& peer, const std::exception& error);

// Whole receiving side of one session. A chain that cannot take another
// increment is refused before the request is read.
ChainWriterStats serve_chain_writer(const std::filesystem::path& base_image,
                                    ByteChannel& peer,
                                    std::shared_ptr<Logger> logger = nullptr);
