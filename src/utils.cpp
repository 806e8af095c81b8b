#include "utils.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>

BlockHash sha1_block(const char* data, std::size_t length){
    static_assert(SHA_DIGEST_LENGTH == kHashLength, "block hash must be a 160-bit digest");
    BlockHash out{};
    SHA1(reinterpret_cast<const unsigned char*>(data), length, out.data());
    return out;
}

BlockHash sha1_block(const std::vector<char>& data){
    return sha1_block(data.data(), data.size());
}

std::string hex_from_bytes(const unsigned char* data, std::size_t length){
    std::ostringstream oss;
    for(std::size_t i = 0; i < length; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

std::string hex_from_hash(const BlockHash& hash){
    return hex_from_bytes(hash.data(), hash.size());
}

std::string sanitize_string(const std::string& raw, std::size_t max_length){
    std::string clean;
    clean.reserve(raw.size());
    for(unsigned char c : raw){
        if(std::isprint(c) || c == ' ') clean.push_back(static_cast<char>(c));
    }
    max_length = std::max<std::size_t>(3, max_length);
    if(clean.size() <= max_length) return clean;
    return clean.substr(0, max_length - 3) + "...";
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}
