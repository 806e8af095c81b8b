#pragma once

#include "byte_channel.hpp"
#include "chain_writer.hpp"
#include "increment_file.hpp"
#include "log.hpp"
#include "source_stream.hpp"
#include "sync_driver.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace blocksync::test {

class TempWorkspace {
public:
  explicit TempWorkspace(const std::string& name) {
    root_ = std::filesystem::temp_directory_path() /
            ("blocksync_" + name + "_" + std::to_string(::getpid()));
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    std::filesystem::create_directories(root_);
  }
  ~TempWorkspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempWorkspace(const TempWorkspace&) = delete;
  TempWorkspace& operator=(const TempWorkspace&) = delete;

  std::filesystem::path operator/(const std::string& name) const { return root_ / name; }
  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if(!out) throw std::runtime_error("unable to write " + path.string());
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) throw std::runtime_error("unable to read " + path.string());
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::vector<char> bytes(const std::string& s) {
  return std::vector<char>(s.begin(), s.end());
}

inline std::string hash_bytes(const BlockHash& hash) {
  return std::string(reinterpret_cast<const char*>(hash.data()), hash.size());
}

inline BlockHash hash_of(const std::string& s) {
  return sha1_block(s.data(), s.size());
}

// Writes an increment file directly; records are (offset, payload).
inline void write_increment(const std::filesystem::path& path,
                            uint64_t block_size,
                            const std::vector<std::pair<uint64_t, std::string>>& records) {
  IncrementHeader header;
  header.block_size = block_size;
  header.created = local_timestamp();
  IncrementWriter writer(path, header);
  for(const auto& record : records) {
    writer.append(record.first, hash_of(record.second), bytes(record.second));
  }
  writer.seal();
}

inline bool expect(bool condition, const std::string& what) {
  if(!condition) {
    std::cout << "\n    expectation failed: " << what << "\n";
  }
  return condition;
}

template<typename Error, typename Fn>
bool expect_throws(Fn&& fn, const std::string& what) {
  try {
    fn();
  } catch(const Error&) {
    return true;
  } catch(const std::exception& e) {
    std::cout << "\n    " << what << ": unexpected exception: " << e.what() << "\n";
    return false;
  }
  std::cout << "\n    " << what << ": nothing thrown\n";
  return false;
}

template<typename Error>
bool holds_error(const std::exception_ptr& error) {
  if(!error) return false;
  try {
    std::rethrow_exception(error);
  } catch(const Error&) {
    return true;
  } catch(...) {
    return false;
  }
}

inline std::string describe(const std::exception_ptr& error) {
  if(!error) return "none";
  try {
    std::rethrow_exception(error);
  } catch(const std::exception& e) {
    return e.what();
  } catch(...) {
    return "unknown";
  }
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](const std::string& source, LogChannel channel, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string tag = label.empty() ? source + ":" + channel_name(channel) : label;
        lines_.emplace_back(tag + ": " + message);
      });
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    for(auto& attachment : attachments_) {
      attachment.logger->remove_listener(attachment.handle);
    }
    attachments_.clear();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
  std::vector<Attachment> attachments_;
};

// Two pipes joined into a channel for each end.
struct ChannelPair {
  std::unique_ptr<DescriptorChannel> near;
  std::unique_ptr<DescriptorChannel> far;
};

inline ChannelPair make_channel_pair(const std::string& far_name, const std::string& near_name) {
  int near_to_far[2];
  int far_to_near[2];
  if(::pipe2(near_to_far, O_CLOEXEC) != 0 || ::pipe2(far_to_near, O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  ChannelPair pair;
  pair.near = std::make_unique<DescriptorChannel>(far_to_near[0], near_to_far[1], far_name);
  pair.far = std::make_unique<DescriptorChannel>(near_to_far[0], far_to_near[1], near_name);
  return pair;
}

struct SessionOutcome {
  SyncResult result;
  SourceStreamStats source_stats;
  ChainWriterStats writer_stats;
  std::exception_ptr driver_error;
  std::exception_ptr source_error;
  std::exception_ptr writer_error;

  bool ok() const { return !driver_error && !source_error && !writer_error; }
  std::string errors() const {
    return "driver: " + describe(driver_error) +
           ", source: " + describe(source_error) +
           ", writer: " + describe(writer_error);
  }
};

// One complete sync session in this process: the endpoints run on threads and
// the driver on the calling thread, joined by pipes.
inline SessionOutcome run_local_session(const std::filesystem::path& source,
                                        const std::filesystem::path& base_image,
                                        SyncOptions options,
                                        std::shared_ptr<Logger> logger = nullptr) {
  SessionOutcome outcome;
  options.source_path = source.string();
  auto source_link = make_channel_pair("source", "driver");
  auto writer_link = make_channel_pair("destination", "driver");

  std::thread source_thread([&outcome, &source, logger, channel = std::move(source_link.far)]() mutable {
    try {
      SourceStream stream(source, *channel, logger, [](const std::filesystem::path&){ return std::string("test-id"); });
      outcome.source_stats = stream.run();
    } catch(...) {
      outcome.source_error = std::current_exception();
    }
  });
  std::thread writer_thread([&outcome, &base_image, logger, channel = std::move(writer_link.far)]() mutable {
    try {
      outcome.writer_stats = serve_chain_writer(base_image, *channel, logger);
    } catch(...) {
      outcome.writer_error = std::current_exception();
    }
  });

  {
    // the driver's ends close before joining so stalled endpoints see end-of-stream
    auto to_source = std::move(source_link.near);
    auto to_writer = std::move(writer_link.near);
    try {
      SyncDriver driver(*to_source, *to_writer, options, logger);
      outcome.result = driver.run();
    } catch(...) {
      outcome.driver_error = std::current_exception();
    }
  }
  source_thread.join();
  writer_thread.join();
  return outcome;
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

inline int run_test_cases(const char* suite, const std::vector<TestCase>& tests, int argc, char** argv) {
  bool verbose = (std::getenv("BLOCKSYNC_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("BLOCKSYNC_TEST_LOGS") != nullptr) || verbose;
  LogOptions log_options;
  log_options.verbose = verbose;
  init(log_options);
  if(!show_logs) {
    set_log_passthrough(false);
  }

  LogCapture logs;
  TestContext ctx{logs, verbose};
  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(const auto& test : tests) {
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cout << "\n    exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
    }
  }
  std::cout << "\n";
  set_log_passthrough(true);
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace blocksync::test
