#include "chain_cursor.hpp"
#include <string>
#include "errors.hpp"

namespace {

std::string read_header_line(std::ifstream& in, const std::filesystem::path& path) {
  std::string line;
  if(!std::getline(in, line)) {
    throw RecordParsingError("Missing header in '" + path.string() + "'");
  }
  return line;
}

} // namespace

IncrementHeader read_increment_header(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary | std::ios::in);
  if(!in) {
    throw IoError("Unable to open increment '" + path.string() + "'");
  }
  return parse_header_line(read_header_line(in, path), path.string());
}

ChainCursor::ChainCursor(std::filesystem::path path, unsigned sequence, std::shared_ptr<Logger> logger)
  : path_(std::move(path)), sequence_(sequence), logger_(std::move(logger)) {
  in_.open(path_, std::ios::binary | std::ios::in);
  if(!in_) {
    throw IoError("Unable to open increment '" + path_.string() + "'");
  }
  header_ = parse_header_line(read_header_line(in_, path_), path_.string());
  read_record_header();
}

void ChainCursor::read_record_header() {
  RecordHeaderBytes bytes{};
  in_.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  const auto got = static_cast<std::size_t>(in_.gcount());
  if(got == 0) {
    finish();
    return;
  }
  if(got != bytes.size()) {
    throw RecordParsingError("Truncated record header in '" + path_.string() + "' after offset " +
                             (offset_ == kEnd ? std::string("<start>") : std::to_string(offset_)));
  }
  auto record = decode_record_header(bytes);
  if(offset_ != kEnd && record.offset <= offset_) {
    throw RecordParsingError("Record offset " + std::to_string(record.offset) + " in '" + path_.string() +
                             "' does not follow " + std::to_string(offset_));
  }
  offset_ = record.offset;
  hash_ = record.hash;
}

void ChainCursor::finish() {
  offset_ = kEnd;
  hash_ = BlockHash{};
  in_.close();
}

void ChainCursor::take_record(std::size_t length, Block& block) {
  if(exhausted()) return;
  block.offset = offset_;
  block.hash = hash_;
  block.data.resize(length);
  in_.read(block.data.data(), static_cast<std::streamsize>(length));
  if(static_cast<std::size_t>(in_.gcount()) != length) {
    throw RecordParsingError("Truncated record at offset " + std::to_string(offset_) + " in '" +
                             path_.string() + "': expected " + std::to_string(length) +
                             " bytes, got " + std::to_string(in_.gcount()));
  }
  read_record_header();
}

void ChainCursor::skip_record(std::size_t length) {
  if(exhausted()) return;
  in_.seekg(static_cast<std::streamoff>(length), std::ios::cur);
  if(!in_) {
    throw RecordParsingError("Unable to skip record at offset " + std::to_string(offset_) +
                             " in '" + path_.string() + "'");
  }
  read_record_header();
}
