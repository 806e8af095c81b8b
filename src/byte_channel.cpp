#include "byte_channel.hpp"
#include "errors.hpp"
#include <unistd.h>
#include <cstring>
#include <istream>

BlockHash ByteChannel::read_hash(){
    BlockHash hash{};
    read_exact(hash.data(), hash.size());
    return hash;
}

void ByteChannel::write_hash(const BlockHash& hash){
    write_all(hash.data(), hash.size());
    flush();
}

std::vector<char> ByteChannel::read_bytes(std::size_t length){
    std::vector<char> out(length);
    if(length > 0) read_exact(out.data(), length);
    return out;
}

void ByteChannel::write_bytes(const std::vector<char>& data){
    if(!data.empty()) write_all(data.data(), data.size());
    flush();
}

nlohmann::json ByteChannel::read_json(){
    auto line = read_line();
    try {
        return nlohmann::json::parse(line);
    } catch(const nlohmann::json::exception& ex){
        throw ProtocolError("Failed to parse JSON from " + peer_name_ + ": " + ex.what() +
                            "  raw: " + sanitize_string(line, 300));
    }
}

void ByteChannel::write_json(const nlohmann::json& j){
    auto s = j.dump() + "\n";
    write_all(s.data(), s.size());
    flush();
}

void ByteChannel::peer_died(const std::string& what) const {
    throw PeerDied(peer_name_ + " died: " + what);
}

DescriptorChannel::DescriptorChannel(int in_fd, int out_fd, std::string peer_name)
: ByteChannel(std::move(peer_name)),
  in_(io_),
  out_(io_)
{
    if(in_fd == out_fd){
        int dup_fd = ::dup(out_fd);
        if(dup_fd < 0){
            ::close(in_fd);
            throw IoError("dup() failed: " + std::string(std::strerror(errno)));
        }
        out_fd = dup_fd;
    }
    in_.assign(in_fd);
    out_.assign(out_fd);
}

DescriptorChannel::~DescriptorChannel(){
    close();
}

void DescriptorChannel::close(){
    std::error_code ec;
    if(in_.is_open()) in_.close(ec);
    if(out_.is_open()) out_.close(ec);
}

void DescriptorChannel::read_exact(void* dst, std::size_t length){
    auto* p = static_cast<char*>(dst);
    // bytes already pulled in by a previous read_line come first
    std::size_t buffered = std::min(length, read_buf_.size());
    if(buffered > 0){
        asio::buffer_copy(asio::buffer(p, buffered), read_buf_.data());
        read_buf_.consume(buffered);
    }
    if(buffered == length) return;
    if(!in_.is_open()) peer_died("channel closed");

    std::error_code ec;
    std::size_t got = asio::read(in_, asio::buffer(p + buffered, length - buffered), ec);
    if(got != length - buffered){
        peer_died("expected " + std::to_string(length) + " bytes, got " +
                  std::to_string(buffered + got) + (ec ? " (" + ec.message() + ")" : ""));
    }
}

void DescriptorChannel::write_all(const void* src, std::size_t length){
    if(!out_.is_open()) peer_died("channel closed");
    std::error_code ec;
    asio::write(out_, asio::buffer(src, length), ec);
    if(ec) peer_died("write failed: " + ec.message());
}

std::string DescriptorChannel::read_line(){
    if(!in_.is_open()) peer_died("channel closed");
    std::error_code ec;
    asio::read_until(in_, read_buf_, '\n', ec);
    if(ec){
        peer_died("no line received (" + ec.message() + ")");
    }
    std::istream is(&read_buf_);
    std::string line;
    std::getline(is, line);
    return line;
}

MemoryChannel::MemoryChannel(std::string input, std::string peer_name)
: ByteChannel(std::move(peer_name)), input_(std::move(input))
{
}

void MemoryChannel::read_exact(void* dst, std::size_t length){
    if(unread() < length){
        peer_died("expected " + std::to_string(length) + " bytes, got " + std::to_string(unread()));
    }
    std::memcpy(dst, input_.data() + read_pos_, length);
    read_pos_ += length;
}

void MemoryChannel::write_all(const void* src, std::size_t length){
    output_.append(static_cast<const char*>(src), length);
}

std::string MemoryChannel::read_line(){
    auto pos = input_.find('\n', read_pos_);
    if(pos == std::string::npos) peer_died("no line received");
    std::string line = input_.substr(read_pos_, pos - read_pos_);
    read_pos_ = pos + 1;
    return line;
}
