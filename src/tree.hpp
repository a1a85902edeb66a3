#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "content_hash.hpp"

enum class EntryKind : uint8_t { File = 'F', Tree = 'D' };

const char* entry_kind_name(EntryKind kind);

struct TreeEntry {
  std::string name;
  EntryKind kind = EntryKind::File;
  ContentHash hash;
  uint64_t size = 0; // file bytes, or total file bytes below a subtree
};

// One directory. Entries are kept in canonical (byte-wise name) order.
struct TreeNode {
  std::vector<TreeEntry> entries;

  void canonicalize();
  const TreeEntry* find(const std::string& name) const;
  uint64_t total_size() const;
};

// Byte string the TreeHash is taken over. The node's own name is not part of it.
std::string canonical_bytes(const TreeNode& node);
TreeHash compute_tree_hash(const TreeNode& node);

bool is_valid_entry_name(const std::string& name);

struct FileManifest {
  uint64_t size = 0;
  uint32_t chunk_size = 0;
  std::vector<ContentHash> chunk_hashes;

  std::size_t chunk_count() const { return chunk_hashes.size(); }
  uint64_t chunk_offset(std::size_t index) const { return static_cast<uint64_t>(index) * chunk_size; }
  uint32_t chunk_length(std::size_t index) const;
  // Chunk count implied by size and chunk_size.
  std::size_t expected_chunk_count() const;
};

struct IndexIssue {
  std::string path;
  std::string reason;
};

// A peer's offer of one rooted tree: every distinct node reachable from the
// root, the chunk manifest of every file, and the subtrees that were skipped.
struct Declaration {
  std::string root_name;
  TreeHash root;
  std::map<TreeHash, TreeNode> nodes;
  std::map<FileHash, FileManifest> files;
  std::vector<IndexIssue> issues;

  const TreeNode* node(const TreeHash& hash) const;
  const FileManifest* file(const FileHash& hash) const;
  uint64_t total_size() const;
};

// Throws ProtocolError when hashes do not re-derive or references dangle.
void validate_declaration(const Declaration& declaration);

nlohmann::json tree_node_to_json(const TreeNode& node);
TreeNode tree_node_from_json(const nlohmann::json& j);
nlohmann::json manifest_to_json(const FileManifest& manifest);
FileManifest manifest_from_json(const nlohmann::json& j);

nlohmann::json declaration_to_json(const Declaration& declaration);
// Parses and validates. Throws ProtocolError.
Declaration declaration_from_json(const nlohmann::json& j);

ContentHash parse_hash_field(const nlohmann::json& j, const char* key);
