#include "protocol.hpp"
#include "errors.hpp"

namespace {

template<typename T>
T field(const json& j, const char* key, const char* message){
    try {
        return j.at(key).get<T>();
    } catch(const json::exception& ex){
        throw ProtocolError(std::string(message) + ": field '" + key + "' " + ex.what());
    }
}

void require_object(const json& j, const char* message){
    if(!j.is_object()) throw ProtocolError(std::string(message) + ": expected a JSON object");
}

} // namespace

json make_source_request(const SourceRequest& request){
    json j;
    j["block_size"] = request.block_size;
    return j;
}

json make_source_reply(const SourceReply& reply){
    json j;
    j["identifier"] = reply.identifier;
    j["size"] = reply.size;
    j["protocol_version"] = reply.protocol_version;
    return j;
}

json make_writer_request(const WriterRequest& request){
    json j;
    j["block_size"] = request.block_size;
    j["source_path"] = request.source_path;
    j["source_identifier"] = request.source_identifier;
    j["comment"] = request.comment;
    j["source_size_bytes"] = request.source_size_bytes;
    return j;
}

json make_writer_reply(const WriterReply& reply){
    json j;
    j["protocol_version"] = reply.protocol_version;
    if(!reply.error_kind.empty()){
        j["error"] = {{"kind", reply.error_kind}, {"message", reply.error_message}};
    }
    return j;
}

SourceRequest parse_source_request(const json& j){
    const char* what = "malformed source request";
    require_object(j, what);
    SourceRequest out;
    out.block_size = field<uint64_t>(j, "block_size", what);
    if(out.block_size == 0) throw ProtocolError("source request carries block size 0");
    return out;
}

SourceReply parse_source_reply(const json& j){
    const char* what = "malformed source reply";
    require_object(j, what);
    SourceReply out;
    out.protocol_version = field<std::string>(j, "protocol_version", what);
    out.identifier = field<std::string>(j, "identifier", what);
    out.size = field<uint64_t>(j, "size", what);
    return out;
}

WriterRequest parse_writer_request(const json& j){
    const char* what = "malformed destination request";
    require_object(j, what);
    WriterRequest out;
    out.block_size = field<uint64_t>(j, "block_size", what);
    out.source_path = field<std::string>(j, "source_path", what);
    out.source_identifier = field<std::string>(j, "source_identifier", what);
    out.comment = field<std::string>(j, "comment", what);
    out.source_size_bytes = field<uint64_t>(j, "source_size_bytes", what);
    if(out.block_size == 0) throw ProtocolError("destination request carries block size 0");
    return out;
}

WriterReply parse_writer_reply(const json& j){
    const char* what = "malformed destination reply";
    require_object(j, what);
    WriterReply out;
    out.protocol_version = field<std::string>(j, "protocol_version", what);
    if(j.contains("error")){
        const auto& err = j.at("error");
        out.error_kind = field<std::string>(err, "kind", what);
        out.error_message = err.value("message", "");
    }
    return out;
}

void require_protocol_version(const std::string& peer, const std::string& version){
    if(version != kProtocolVersion){
        throw VersionMismatch(peer + " version (" + version +
                              ") does not match local version (" + kProtocolVersion + ")");
    }
}
