#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

inline constexpr std::size_t kHashLength = 20; // SHA-1

using BlockHash = std::array<unsigned char, kHashLength>;

BlockHash sha1_block(const char* data, std::size_t length);
BlockHash sha1_block(const std::vector<char>& data);

// The one verdict all three parties must agree on.
inline bool blocks_differ(const BlockHash& a, const BlockHash& b) {
  return a != b;
}

std::string hex_from_bytes(const unsigned char* data, std::size_t length);
std::string hex_from_hash(const BlockHash& hash);

std::string sanitize_string(const std::string& raw, std::size_t max_length);
std::string trim_copy(std::string value);
std::string to_lower(std::string value);
