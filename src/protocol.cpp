#include "protocol.hpp"

#include "errors.hpp"

namespace {

int64_t to_epoch_seconds(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_seconds(int64_t seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace

json make_request(const std::string& type, const std::string& request_id) {
  json j;
  j["type"] = type;
  j["request_id"] = request_id;
  return j;
}

json make_response(const json& request) {
  json j;
  j["type"] = string_field(request, "type") + "_response";
  j["request_id"] = string_field(request, "request_id");
  return j;
}

json make_error_response(const json& request, const std::string& error) {
  auto j = make_response(request);
  j["error"] = error;
  return j;
}

bool is_error_response(const json& response) {
  return response.contains("error") && response["error"].is_string();
}

json make_hello(const std::string& peer_id, const std::string& address, const std::string& role) {
  json j;
  j["type"] = "hello";
  j["peer_id"] = peer_id;
  j["address"] = address;
  j["role"] = role;
  return j;
}

json make_offer_request(const std::string& request_id, const FileHash& file) {
  auto j = make_request("offer", request_id);
  j["file"] = file.to_hex();
  return j;
}

json make_chunk_request(const std::string& request_id,
                        const FileHash& file,
                        std::size_t index,
                        uint64_t offset,
                        uint32_t length) {
  auto j = make_request("chunk", request_id);
  j["file"] = file.to_hex();
  j["index"] = index;
  j["offset"] = offset;
  j["length"] = length;
  return j;
}

json peer_record_to_json(const PeerRecord& peer) {
  json j;
  j["owner"] = peer.owner;
  j["address"] = peer.address;
  j["status"] = peer_status_name(peer.status);
  json roots = json::array();
  for(const auto& root : peer.roots) roots.push_back(root.to_hex());
  j["roots"] = roots;
  j["last_seen"] = to_epoch_seconds(peer.last_seen);
  return j;
}

PeerRecord peer_record_from_json(const json& j) {
  PeerRecord peer;
  peer.owner = required_string(j, "owner");
  peer.address = j.value("address", "");
  peer.status = j.value("status", "online") == "online" ? PeerStatus::Online : PeerStatus::Offline;
  if(j.contains("roots") && j["roots"].is_array()) {
    for(const auto& root : j["roots"]) {
      auto parsed = root.is_string() ? ContentHash::from_hex(root.get<std::string>()) : std::nullopt;
      if(!parsed) throw ProtocolError("malformed root in peer record for " + peer.owner);
      peer.roots.insert(*parsed);
    }
  }
  peer.last_seen = from_epoch_seconds(j.value("last_seen", int64_t{0}));
  return peer;
}

json declared_root_to_json(const DeclaredRoot& root) {
  json j;
  j["owner"] = root.owner;
  j["root"] = root.root.to_hex();
  j["root_name"] = root.root_name;
  j["size"] = root.size;
  j["declared_at"] = to_epoch_seconds(root.declared_at);
  return j;
}

DeclaredRoot declared_root_from_json(const json& j) {
  DeclaredRoot root;
  root.owner = required_string(j, "owner");
  root.root = parse_hash_field(j, "root");
  root.root_name = j.value("root_name", "");
  root.size = j.value("size", uint64_t{0});
  root.declared_at = from_epoch_seconds(j.value("declared_at", int64_t{0}));
  return root;
}

json index_entry_to_json(const IndexEntry& entry) {
  json j;
  j["hash"] = entry.hash.to_hex();
  j["kind"] = entry_kind_name(entry.kind);
  j["size"] = entry.size;
  json refs = json::array();
  for(const auto& ref : entry.refs) {
    json r;
    r["owner"] = ref.owner;
    r["container"] = ref.container.to_hex();
    r["name"] = ref.name;
    refs.push_back(r);
  }
  j["refs"] = refs;
  if(entry.node) j["node"] = tree_node_to_json(*entry.node);
  if(entry.manifest) j["manifest"] = manifest_to_json(*entry.manifest);
  return j;
}

IndexEntry index_entry_from_json(const json& j) {
  try {
    IndexEntry entry;
    entry.hash = parse_hash_field(j, "hash");
    entry.kind = j.value("kind", "file") == "dir" ? EntryKind::Tree : EntryKind::File;
    entry.size = j.value("size", uint64_t{0});
    for(const auto& r : j.value("refs", json::array())) {
      IndexRef ref;
      ref.owner = required_string(r, "owner");
      ref.container = parse_hash_field(r, "container");
      ref.name = r.value("name", "");
      entry.refs.insert(std::move(ref));
    }
    if(j.contains("node")) {
      entry.node = std::make_shared<const TreeNode>(tree_node_from_json(j["node"]));
    }
    if(j.contains("manifest")) {
      entry.manifest = std::make_shared<const FileManifest>(manifest_from_json(j["manifest"]));
    }
    return entry;
  } catch(const json::exception& e) {
    throw ProtocolError(std::string("malformed index entry: ") + e.what());
  }
}

std::string required_string(const json& j, const char* key) {
  if(!j.contains(key) || !j.at(key).is_string()) {
    throw ProtocolError(std::string("missing field '") + key + "'");
  }
  return j.at(key).get<std::string>();
}

std::string string_field(const json& j, const char* key, const std::string& fallback) {
  if(!j.is_object()) return fallback;
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}
