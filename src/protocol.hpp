#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "content_directory.hpp"
#include "tree_store.hpp"

using json = nlohmann::json;

// Requests carry "type" and "request_id"; the answer echoes the id with type
// "<type>_response" and, on failure, an "error" string instead of a payload.
inline constexpr const char* kUnavailable = "unavailable";

json make_request(const std::string& type, const std::string& request_id);
json make_response(const json& request);
json make_error_response(const json& request, const std::string& error);
bool is_error_response(const json& response);

json make_hello(const std::string& peer_id, const std::string& address, const std::string& role);

json make_offer_request(const std::string& request_id, const FileHash& file);
json make_chunk_request(const std::string& request_id,
                        const FileHash& file,
                        std::size_t index,
                        uint64_t offset,
                        uint32_t length);

json peer_record_to_json(const PeerRecord& peer);
PeerRecord peer_record_from_json(const json& j);

json declared_root_to_json(const DeclaredRoot& root);
DeclaredRoot declared_root_from_json(const json& j);

json index_entry_to_json(const IndexEntry& entry);
IndexEntry index_entry_from_json(const json& j);

// Throws ProtocolError when the field is missing or not a string.
std::string required_string(const json& j, const char* key);
// `fallback` when the field is missing or not a string. Never throws.
std::string string_field(const json& j, const char* key, const std::string& fallback = "");
