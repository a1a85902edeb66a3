#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tree.hpp"

struct PlannedFile {
  std::string relative_path; // generic form, relative to the download root
  FileHash hash;
  FileManifest manifest;
};

// Everything needed to fetch and materialize one target: every file with its
// chunk manifest plus the directories to recreate, in a stable order.
struct TransferPlan {
  ContentHash target;
  TreeHash context;  // zero when the target is a declared root with no container
  EntryKind target_kind = EntryKind::File;
  std::string root_name; // top-level name created under the download directory
  std::vector<PlannedFile> files;
  std::vector<std::string> directories; // relative, parents before children

  uint64_t total_bytes() const;
  std::size_t total_chunks() const;
};

nlohmann::json transfer_plan_to_json(const TransferPlan& plan);
// Throws ProtocolError.
TransferPlan transfer_plan_from_json(const nlohmann::json& j);

// Appends every directory and file below `tree` to the plan, depth first.
// Returns false when a referenced node or manifest is missing.
template<typename NodeLookup, typename ManifestLookup>
bool expand_tree_plan(const TreeHash& tree,
                      const std::string& prefix,
                      NodeLookup&& node_of,
                      ManifestLookup&& manifest_of,
                      TransferPlan& plan) {
  const TreeNode* node = node_of(tree);
  if(!node) return false;
  for(const auto& entry : node->entries) {
    std::string path = prefix.empty() ? entry.name : prefix + "/" + entry.name;
    if(entry.kind == EntryKind::Tree) {
      plan.directories.push_back(path);
      if(!expand_tree_plan(entry.hash, path, node_of, manifest_of, plan)) return false;
    } else {
      const FileManifest* manifest = manifest_of(entry.hash);
      if(!manifest) return false;
      plan.files.push_back({path, entry.hash, *manifest});
    }
  }
  return true;
}
