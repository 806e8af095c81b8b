#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include "block_file.hpp"
#include "byte_channel.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Best-effort filesystem identifier of a device (blkid); empty on failure.
using IdentifierLookup = std::function<std::string(const std::filesystem::path&)>;
std::string lookup_device_identifier(const std::filesystem::path& device);

struct SourceStreamStats {
  uint64_t blocks = 0;
  uint64_t sent_blocks = 0;
  uint64_t bytes_read = 0;
};

// Sending endpoint: hashes the source block by block and ships the payload
// of every block whose hash differs from the peer's.
class SourceStream {
public:
  SourceStream(std::filesystem::path device,
               ByteChannel& peer,
               std::shared_ptr<Logger> logger = nullptr,
               IdentifierLookup lookup = lookup_device_identifier);

  SourceStreamStats run();

  SourceReply handshake();
  SourceStreamStats stream_blocks();

private:
  std::filesystem::path device_;
  ByteChannel& peer_;
  std::shared_ptr<Logger> logger_;
  IdentifierLookup lookup_;
  std::unique_ptr<BlockFile> file_;
};
