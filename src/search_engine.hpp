#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "consensus.hpp"
#include "log.hpp"
#include "tree.hpp"

class TreeStore;
class IndexState;

enum class QueryKind { Hash, Name, Extension, Folder };

const char* query_kind_name(QueryKind kind);

struct Query {
  QueryKind kind = QueryKind::Name;
  std::string text; // lowercased needle; the extension without its dot
  ContentHash hash; // QueryKind::Hash only
};

// "hash:<hex>", a bare 64-digit hex string, "ext:mp3", ".mp3", "*.mp3",
// "folder:name", "name/", "name:text", anything else is a name substring.
// A blank query is a name query that matches nothing. Throws QueryError for
// an empty "ext:"/"folder:" needle or a malformed hash.
Query classify_query(const std::string& raw);
// Explicit kind ("hash", "name", "ext", "folder", or "auto"). Throws QueryError.
Query make_query(const std::string& kind, const std::string& text);

struct FileMatch {
  FileHash hash;
  uint64_t size = 0;
  std::string display_name;
  std::vector<ContextCandidate> contexts; // ranked, best first
  bool ambiguous = false;
  std::size_t seeders = 0;
  // Other entries of the leading context's folder, capped; sibling_total is uncapped.
  std::vector<TreeEntry> siblings;
  std::size_t sibling_total = 0;
};

struct SubtreeEntry {
  std::string name;
  EntryKind kind = EntryKind::File;
  ContentHash hash;
  uint64_t size = 0;
  std::vector<SubtreeEntry> children;
};

struct FolderMatch {
  TreeHash hash;
  std::string display_name;
  std::vector<ContextCandidate> contexts;
  bool ambiguous = false;
  std::size_t seeders = 0;
  SubtreeEntry tree;
  uint64_t total_size = 0;
  std::size_t file_count = 0;
};

using SearchResult = std::variant<FileMatch, FolderMatch>;

const ContentHash& result_hash(const SearchResult& result);

struct SearchOptions {
  std::size_t sibling_limit = 8;
  std::size_t max_results = 200;
};

class SearchEngine {
public:
  SearchEngine(const TreeStore& store, SearchOptions options = {}, std::shared_ptr<Logger> logger = nullptr);

  // Ordered by seeder count, then name similarity. Empty only when nothing matches.
  std::vector<SearchResult> search(const Query& query) const;
  std::vector<SearchResult> search(const std::string& raw) const { return search(classify_query(raw)); }

private:
  FileMatch make_file_match(const IndexState& state, const ContentHash& hash, const std::string& query) const;
  FolderMatch make_folder_match(const IndexState& state, const ContentHash& hash, const std::string& query) const;

  const TreeStore& store_;
  SearchOptions options_;
  std::shared_ptr<Logger> logger_;
};

nlohmann::json search_result_to_json(const SearchResult& result);
// Throws ProtocolError.
SearchResult search_result_from_json(const nlohmann::json& j);
