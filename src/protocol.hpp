#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

using json = nlohmann::json;

// protocol.hpp
inline constexpr const char* kProtocolVersion = "1.0";

struct SourceRequest {
    uint64_t block_size = 0;
};

struct SourceReply {
    std::string identifier;
    uint64_t size = 0;
    std::string protocol_version = kProtocolVersion;
};

struct WriterRequest {
    uint64_t block_size = 0;
    std::string source_path;
    std::string source_identifier;
    std::string comment;
    uint64_t source_size_bytes = 0;
};

// A non-empty error_kind means the chain writer refused the session.
struct WriterReply {
    std::string protocol_version = kProtocolVersion;
    std::string error_kind;
    std::string error_message;
};

json make_source_request(const SourceRequest& request);
json make_source_reply(const SourceReply& reply);
json make_writer_request(const WriterRequest& request);
json make_writer_reply(const WriterReply& reply);

// Parsers throw ProtocolError on a missing or mistyped field.
SourceRequest parse_source_request(const json& j);
SourceReply parse_source_reply(const json& j);
WriterRequest parse_writer_request(const json& j);
WriterReply parse_writer_reply(const json& j);

// Throws VersionMismatch naming the peer.
void require_protocol_version(const std::string& peer, const std::string& version);
