#include "tree.hpp"

#include <algorithm>
#include <set>

#include "errors.hpp"
#include "utils.hpp"

namespace {

constexpr const char kTreeDomainTag[] = "treeswarm-tree-v1";

void append_u32_be(std::string& out, uint32_t value) {
  out.push_back(static_cast<char>((value >> 24) & 0xff));
  out.push_back(static_cast<char>((value >> 16) & 0xff));
  out.push_back(static_cast<char>((value >> 8) & 0xff));
  out.push_back(static_cast<char>(value & 0xff));
}

EntryKind parse_kind(const std::string& text) {
  if(text == "file") return EntryKind::File;
  if(text == "dir") return EntryKind::Tree;
  throw ProtocolError("unknown entry kind '" + text + "'");
}

} // namespace

const char* entry_kind_name(EntryKind kind) {
  return kind == EntryKind::Tree ? "dir" : "file";
}

void TreeNode::canonicalize() {
  std::sort(entries.begin(), entries.end(), [](const TreeEntry& a, const TreeEntry& b){
    return a.name < b.name;
  });
}

const TreeEntry* TreeNode::find(const std::string& name) const {
  auto it = std::lower_bound(entries.begin(), entries.end(), name,
    [](const TreeEntry& e, const std::string& n){ return e.name < n; });
  if(it == entries.end() || it->name != name) return nullptr;
  return &*it;
}

uint64_t TreeNode::total_size() const {
  uint64_t total = 0;
  for(const auto& e : entries) total += e.size;
  return total;
}

std::string canonical_bytes(const TreeNode& node) {
  std::string out(kTreeDomainTag, sizeof(kTreeDomainTag));
  append_u32_be(out, static_cast<uint32_t>(node.entries.size()));
  for(const auto& entry : node.entries) {
    out.push_back(static_cast<char>(entry.kind));
    append_u32_be(out, static_cast<uint32_t>(entry.name.size()));
    out.append(entry.name);
    out.append(reinterpret_cast<const char*>(entry.hash.bytes.data()), entry.hash.bytes.size());
  }
  return out;
}

TreeHash compute_tree_hash(const TreeNode& node) {
  return ContentHash::of(canonical_bytes(node));
}

bool is_valid_entry_name(const std::string& name) {
  if(name.empty() || name == "." || name == "..") return false;
  if(name.find('/') != std::string::npos || name.find('\0') != std::string::npos) return false;
  // Names travel inside JSON, which only carries UTF-8.
  return is_valid_utf8(name);
}

uint32_t FileManifest::chunk_length(std::size_t index) const {
  uint64_t offset = chunk_offset(index);
  if(offset >= size) return 0;
  return static_cast<uint32_t>(std::min<uint64_t>(chunk_size, size - offset));
}

std::size_t FileManifest::expected_chunk_count() const {
  if(size == 0 || chunk_size == 0) return 0;
  return static_cast<std::size_t>((size + chunk_size - 1) / chunk_size);
}

const TreeNode* Declaration::node(const TreeHash& hash) const {
  auto it = nodes.find(hash);
  return it == nodes.end() ? nullptr : &it->second;
}

const FileManifest* Declaration::file(const FileHash& hash) const {
  auto it = files.find(hash);
  return it == files.end() ? nullptr : &it->second;
}

uint64_t Declaration::total_size() const {
  const auto* root_node = node(root);
  return root_node ? root_node->total_size() : 0;
}

void validate_declaration(const Declaration& declaration) {
  if(!is_valid_utf8(declaration.root_name)) {
    throw ProtocolError("root name '" + escape_invalid_utf8(declaration.root_name) + "' is not UTF-8");
  }
  if(!declaration.node(declaration.root)) {
    throw ProtocolError("declaration root " + declaration.root.short_hex() + " has no node");
  }
  for(const auto& [hash, node] : declaration.nodes) {
    if(compute_tree_hash(node) != hash) {
      throw ProtocolError("tree node " + hash.short_hex() + " does not match its hash");
    }
    std::set<std::string> names;
    for(const auto& entry : node.entries) {
      if(!is_valid_entry_name(entry.name)) {
        throw ProtocolError("invalid entry name '" + escape_invalid_utf8(entry.name) + "'");
      }
      if(!names.insert(entry.name).second) {
        throw ProtocolError("duplicate entry name '" + entry.name + "'");
      }
      if(entry.kind == EntryKind::Tree) {
        if(!declaration.node(entry.hash)) {
          throw ProtocolError("subtree " + entry.hash.short_hex() + " missing from declaration");
        }
      } else {
        const auto* manifest = declaration.file(entry.hash);
        if(!manifest) {
          throw ProtocolError("file " + entry.hash.short_hex() + " missing from declaration");
        }
        if(manifest->size != entry.size) {
          throw ProtocolError("file " + entry.hash.short_hex() + " size disagrees with its manifest");
        }
      }
    }
  }
  for(const auto& [hash, manifest] : declaration.files) {
    if(manifest.size > 0 && manifest.chunk_size == 0) {
      throw ProtocolError("file " + hash.short_hex() + " has no chunk size");
    }
    if(manifest.chunk_count() != manifest.expected_chunk_count()) {
      throw ProtocolError("file " + hash.short_hex() + " chunk count does not cover its size");
    }
  }
}

ContentHash parse_hash_field(const nlohmann::json& j, const char* key) {
  if(!j.contains(key) || !j.at(key).is_string()) {
    throw ProtocolError(std::string("missing hash field '") + key + "'");
  }
  auto parsed = ContentHash::from_hex(j.at(key).get<std::string>());
  if(!parsed) throw ProtocolError(std::string("malformed hash in '") + key + "'");
  return *parsed;
}

nlohmann::json tree_node_to_json(const TreeNode& node) {
  nlohmann::json arr = nlohmann::json::array();
  for(const auto& entry : node.entries) {
    nlohmann::json e;
    e["name"] = entry.name;
    e["kind"] = entry_kind_name(entry.kind);
    e["hash"] = entry.hash.to_hex();
    e["size"] = entry.size;
    arr.push_back(std::move(e));
  }
  return arr;
}

TreeNode tree_node_from_json(const nlohmann::json& j) {
  if(!j.is_array()) throw ProtocolError("tree node must be an array");
  TreeNode node;
  for(const auto& e : j) {
    if(!e.is_object()) throw ProtocolError("tree entry must be an object");
    TreeEntry entry;
    entry.name = e.value("name", "");
    entry.kind = parse_kind(e.value("kind", ""));
    entry.hash = parse_hash_field(e, "hash");
    entry.size = e.value("size", 0ULL);
    node.entries.push_back(std::move(entry));
  }
  node.canonicalize();
  return node;
}

nlohmann::json manifest_to_json(const FileManifest& manifest) {
  nlohmann::json j;
  j["size"] = manifest.size;
  j["chunk_size"] = manifest.chunk_size;
  nlohmann::json chunks = nlohmann::json::array();
  for(const auto& h : manifest.chunk_hashes) chunks.push_back(h.to_hex());
  j["chunks"] = chunks;
  return j;
}

FileManifest manifest_from_json(const nlohmann::json& j) {
  if(!j.is_object()) throw ProtocolError("file manifest must be an object");
  FileManifest manifest;
  manifest.size = j.value("size", 0ULL);
  manifest.chunk_size = j.value("chunk_size", 0U);
  if(j.contains("chunks")) {
    if(!j.at("chunks").is_array()) throw ProtocolError("manifest chunks must be an array");
    for(const auto& c : j.at("chunks")) {
      auto parsed = c.is_string() ? ContentHash::from_hex(c.get<std::string>()) : std::nullopt;
      if(!parsed) throw ProtocolError("malformed chunk hash");
      manifest.chunk_hashes.push_back(*parsed);
    }
  }
  return manifest;
}

nlohmann::json declaration_to_json(const Declaration& declaration) {
  nlohmann::json j;
  j["root_name"] = declaration.root_name;
  j["root"] = declaration.root.to_hex();
  nlohmann::json nodes = nlohmann::json::object();
  for(const auto& [hash, node] : declaration.nodes) {
    nodes[hash.to_hex()] = tree_node_to_json(node);
  }
  j["nodes"] = nodes;
  nlohmann::json files = nlohmann::json::object();
  for(const auto& [hash, manifest] : declaration.files) {
    files[hash.to_hex()] = manifest_to_json(manifest);
  }
  j["files"] = files;
  nlohmann::json issues = nlohmann::json::array();
  for(const auto& issue : declaration.issues) {
    issues.push_back({{"path", issue.path}, {"reason", issue.reason}});
  }
  j["issues"] = issues;
  return j;
}

Declaration declaration_from_json(const nlohmann::json& j) {
  if(!j.is_object()) throw ProtocolError("declaration must be an object");
  Declaration declaration;
  try {
    declaration.root_name = j.value("root_name", "");
    declaration.root = parse_hash_field(j, "root");
    if(!j.contains("nodes") || !j.at("nodes").is_object()) {
      throw ProtocolError("declaration has no nodes");
    }
    for(const auto& item : j.at("nodes").items()) {
      auto hash = ContentHash::from_hex(item.key());
      if(!hash) throw ProtocolError("malformed node key '" + item.key() + "'");
      declaration.nodes.emplace(*hash, tree_node_from_json(item.value()));
    }
    if(j.contains("files")) {
      if(!j.at("files").is_object()) throw ProtocolError("declaration files must be an object");
      for(const auto& item : j.at("files").items()) {
        auto hash = ContentHash::from_hex(item.key());
        if(!hash) throw ProtocolError("malformed file key '" + item.key() + "'");
        declaration.files.emplace(*hash, manifest_from_json(item.value()));
      }
    }
    if(j.contains("issues") && j.at("issues").is_array()) {
      for(const auto& issue : j.at("issues")) {
        declaration.issues.push_back({issue.value("path", ""), issue.value("reason", "")});
      }
    }
  } catch(const nlohmann::json::exception& e) {
    throw ProtocolError(std::string("malformed declaration: ") + e.what());
  }
  validate_declaration(declaration);
  return declaration;
}
