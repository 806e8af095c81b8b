#pragma once
#include <sys/types.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "byte_channel.hpp"
#include "log.hpp"

inline constexpr const char* kDefaultRemoteProgram = "blocksync-remote";

struct RemoteCommand {
  std::string host = "localhost";   // [user@]host, "localhost" runs without ssh
  std::string ssh_identity;
  bool use_sudo = false;
  std::string program = kDefaultRemoteProgram;
  std::string mode;                 // "send" or "receive"
  std::string path;
  bool verbose = false;
};

std::vector<std::string> build_remote_argv(const RemoteCommand& command);

// Child process speaking the protocol on its stdin/stdout. stderr is inherited
// so remote diagnostics reach the operator.
class RemoteProcess {
public:
  RemoteProcess(const std::vector<std::string>& argv,
                std::string peer_name,
                std::shared_ptr<Logger> logger = nullptr);
  ~RemoteProcess();

  RemoteProcess(const RemoteProcess&) = delete;
  RemoteProcess& operator=(const RemoteProcess&) = delete;

  ByteChannel& channel() { return *channel_; }

  bool running();
  // Closes our end of the pipes and reaps the child.
  int wait();
  // "running", "exited with status N" or "killed by signal N".
  std::string exit_description();

private:
  bool poll(bool block);

  pid_t pid_ = -1;
  std::unique_ptr<DescriptorChannel> channel_;
  std::optional<int> status_;
  std::shared_ptr<Logger> logger_;
};

// Runs argv and returns its trimmed stdout; empty if it cannot be run or fails.
std::string run_capture(const std::vector<std::string>& argv);

void ignore_sigpipe();
