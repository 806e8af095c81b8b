#pragma once
#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>
#include "utils.hpp"

// Duplex byte pipe to one protocol peer. Short reads and failed writes throw
// PeerDied; there is no retry and no timeout.
class ByteChannel {
public:
    explicit ByteChannel(std::string peer_name) : peer_name_(std::move(peer_name)) {}
    virtual ~ByteChannel() = default;

    ByteChannel(const ByteChannel&) = delete;
    ByteChannel& operator=(const ByteChannel&) = delete;

    virtual void read_exact(void* dst, std::size_t length) = 0;
    virtual void write_all(const void* src, std::size_t length) = 0;
    // Returns the next line without its '\n'.
    virtual std::string read_line() = 0;
    virtual void flush() {}

    BlockHash read_hash();
    void write_hash(const BlockHash& hash);
    std::vector<char> read_bytes(std::size_t length);
    void write_bytes(const std::vector<char>& data);
    nlohmann::json read_json();
    void write_json(const nlohmann::json& j);

    const std::string& peer_name() const { return peer_name_; }

protected:
    [[noreturn]] void peer_died(const std::string& what) const;

private:
    std::string peer_name_;
};

// Channel over a pair of file descriptors (pipes, stdin/stdout). Takes
// ownership of both descriptors; in_fd and out_fd may be the same socket.
class DescriptorChannel : public ByteChannel {
public:
    DescriptorChannel(int in_fd, int out_fd, std::string peer_name);
    ~DescriptorChannel() override;

    void read_exact(void* dst, std::size_t length) override;
    void write_all(const void* src, std::size_t length) override;
    std::string read_line() override;

    void close();

private:
    asio::io_context io_;
    asio::posix::stream_descriptor in_;
    asio::posix::stream_descriptor out_;
    asio::streambuf read_buf_;
};

// Scripted peer for tests: reads are served from a fixed input and
// everything written is captured.
class MemoryChannel : public ByteChannel {
public:
    explicit MemoryChannel(std::string input = std::string(), std::string peer_name = "memory");

    void read_exact(void* dst, std::size_t length) override;
    void write_all(const void* src, std::size_t length) override;
    std::string read_line() override;

    void append_input(const std::string& bytes) { input_ += bytes; }
    void append_input(const BlockHash& hash) { input_.append(reinterpret_cast<const char*>(hash.data()), hash.size()); }
    const std::string& output() const { return output_; }
    std::size_t unread() const { return input_.size() - read_pos_; }

private:
    std::string input_;
    std::size_t read_pos_ = 0;
    std::string output_;
};
