#include "remote_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "errors.hpp"

namespace {

struct Pipe {
  int read_end = -1;
  int write_end = -1;

  Pipe() {
    int fds[2];
    if(::pipe2(fds, O_CLOEXEC) != 0) {
      throw IoError(std::string("pipe() failed: ") + std::strerror(errno));
    }
    read_end = fds[0];
    write_end = fds[1];
  }
  ~Pipe() {
    close_read();
    close_write();
  }
  void close_read() { if(read_end >= 0) ::close(read_end); read_end = -1; }
  void close_write() { if(write_end >= 0) ::close(write_end); write_end = -1; }
  int release_read() { int fd = read_end; read_end = -1; return fd; }
  int release_write() { int fd = write_end; write_end = -1; return fd; }
};

std::vector<char*> make_exec_argv(const std::vector<std::string>& argv) {
  std::vector<char*> out;
  out.reserve(argv.size() + 1);
  for(const auto& arg : argv) out.push_back(const_cast<char*>(arg.c_str()));
  out.push_back(nullptr);
  return out;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(const std::vector<char*>& exec_argv, int stdin_fd, int stdout_fd) {
  if(stdin_fd >= 0 && ::dup2(stdin_fd, STDIN_FILENO) < 0) ::_exit(127);
  if(stdout_fd >= 0 && ::dup2(stdout_fd, STDOUT_FILENO) < 0) ::_exit(127);
  ::execvp(exec_argv[0], exec_argv.data());
  ::_exit(127);
}

std::string join_argv(const std::vector<std::string>& argv) {
  std::string out;
  for(const auto& arg : argv) {
    if(!out.empty()) out += ' ';
    out += arg;
  }
  return out;
}

} // namespace

std::vector<std::string> build_remote_argv(const RemoteCommand& command) {
  std::vector<std::string> argv;
  if(command.host != "localhost") {
    argv.push_back("ssh");
    if(!command.ssh_identity.empty()) {
      argv.push_back("-i");
      argv.push_back(command.ssh_identity);
    }
    argv.push_back(command.host);
  }
  if(command.use_sudo) {
    argv.push_back("sudo");
  }
  argv.push_back(command.program);
  argv.push_back(command.mode);
  argv.push_back(command.path);
  if(command.verbose) {
    argv.push_back("--verbose");
  }
  return argv;
}

RemoteProcess::RemoteProcess(const std::vector<std::string>& argv,
                             std::string peer_name,
                             std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {
  if(argv.empty()) {
    throw std::invalid_argument("empty command line for " + peer_name);
  }
  Pipe to_child;
  Pipe from_child;
  auto exec_argv = make_exec_argv(argv);

  log_debug(logger_.get(), "starting {}: {}", peer_name, join_argv(argv));
  pid_ = ::fork();
  if(pid_ < 0) {
    throw IoError(std::string("fork() failed: ") + std::strerror(errno));
  }
  if(pid_ == 0) {
    exec_child(exec_argv, to_child.read_end, from_child.write_end);
  }

  to_child.close_read();
  from_child.close_write();
  channel_ = std::make_unique<DescriptorChannel>(from_child.release_read(),
                                                 to_child.release_write(),
                                                 std::move(peer_name));
}

RemoteProcess::~RemoteProcess() {
  try {
    wait();
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "failed to reap child {}: {}", pid_, e.what());
  }
}

bool RemoteProcess::poll(bool block) {
  if(status_ || pid_ <= 0) return false;
  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while(r < 0 && errno == EINTR);
  if(r == pid_) {
    status_ = status;
    return false;
  }
  return r == 0;
}

bool RemoteProcess::running() {
  return poll(false);
}

int RemoteProcess::wait() {
  if(channel_) channel_->close();
  poll(true);
  if(!status_) return -1;
  if(WIFEXITED(*status_)) return WEXITSTATUS(*status_);
  return 128 + WTERMSIG(*status_);
}

std::string RemoteProcess::exit_description() {
  if(running()) return "running";
  if(!status_) return "unknown";
  if(WIFEXITED(*status_)) return "exited with status " + std::to_string(WEXITSTATUS(*status_));
  if(WIFSIGNALED(*status_)) return "killed by signal " + std::to_string(WTERMSIG(*status_));
  return "stopped";
}

std::string run_capture(const std::vector<std::string>& argv) {
  if(argv.empty()) return "";
  try {
    Pipe from_child;
    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    auto exec_argv = make_exec_argv(argv);
    pid_t pid = ::fork();
    if(pid < 0) {
      if(null_fd >= 0) ::close(null_fd);
      return "";
    }
    if(pid == 0) {
      if(null_fd >= 0) ::dup2(null_fd, STDERR_FILENO);
      exec_child(exec_argv, null_fd, from_child.write_end);
    }
    if(null_fd >= 0) ::close(null_fd);
    from_child.close_write();

    asio::io_context io;
    asio::posix::stream_descriptor reader(io, from_child.release_read());
    std::string output;
    std::error_code ec;
    asio::read(reader, asio::dynamic_buffer(output), ec);

    int status = 0;
    while(::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    if(ec && ec != asio::error::eof) return "";
    if(!WIFEXITED(status) || WEXITSTATUS(status) != 0) return "";
    return trim_copy(output);
  } catch(const std::exception&) {
    return "";
  }
}

void ignore_sigpipe() {
  ::signal(SIGPIPE, SIG_IGN);
}
