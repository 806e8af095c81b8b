#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "byte_channel.hpp"
#include "log.hpp"
#include "protocol.hpp"

struct SyncProgress {
  uint64_t same_blocks = 0;
  uint64_t diff_blocks = 0;
  uint64_t processed_bytes = 0;
  uint64_t total_bytes = 0;
  double elapsed_seconds = 0.0;
  double rate_mib_per_second = 0.0;
  double remaining_seconds = 0.0;
  bool finished = false;
};

using SyncProgressCallback = std::function<void(const SyncProgress& progress)>;

struct SyncOptions {
  uint64_t block_size = 1024 * 1024;
  std::string source_path;
  std::string comment;
  // fixed delay per block; a load limiter, not a timeout
  std::chrono::milliseconds pause{0};
  std::chrono::milliseconds progress_interval{1000};
  SyncProgressCallback progress;
};

struct SyncResult {
  uint64_t same_blocks = 0;
  uint64_t diff_blocks = 0;
  uint64_t total_bytes = 0;
  std::chrono::steady_clock::duration elapsed{};
};

// Local relay between the source stream and the chain writer. Every block is
// a fixed rendezvous: both hashes in, both hashes crossed over, and the
// payload forwarded only when they differ.
class SyncDriver {
public:
  SyncDriver(ByteChannel& source,
             ByteChannel& destination,
             SyncOptions options,
             std::shared_ptr<Logger> logger = nullptr);

  SyncResult run();

  SourceReply handshake_source();
  void handshake_destination(const SourceReply& source);
  SyncResult transfer(uint64_t total_size);

private:
  void report(SyncProgress& progress,
              std::chrono::steady_clock::time_point start,
              bool finished);

  ByteChannel& source_;
  ByteChannel& destination_;
  SyncOptions options_;
  std::shared_ptr<Logger> logger_;
  std::chrono::steady_clock::time_point last_report_{};
};
