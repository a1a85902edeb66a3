#include "search_engine.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>

#include "errors.hpp"
#include "tree_store.hpp"
#include "utils.hpp"

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string extension_of(const std::string& lowered_name) {
  auto dot = lowered_name.rfind('.');
  if(dot == std::string::npos || dot == 0 || dot + 1 >= lowered_name.size()) return {};
  return lowered_name.substr(dot + 1);
}

bool is_hex_digest(const std::string& text) {
  if(text.size() != ContentHash::kSize * 2) return false;
  return std::all_of(text.begin(), text.end(), [](unsigned char c){ return std::isxdigit(c) != 0; });
}

Query hash_query(const std::string& text) {
  auto parsed = ContentHash::from_hex(trim_copy(text));
  if(!parsed) {
    throw QueryError("malformed hash '" + text + "'");
  }
  Query q;
  q.kind = QueryKind::Hash;
  q.hash = *parsed;
  q.text = parsed->to_hex();
  return q;
}

Query text_query(QueryKind kind, std::string text) {
  if(kind == QueryKind::Extension) {
    while(!text.empty() && (text.front() == '*' || text.front() == '.')) text.erase(text.begin());
  }
  if(text.empty() && kind != QueryKind::Name) {
    throw QueryError(std::string("empty ") + query_kind_name(kind) + " query");
  }
  Query q;
  q.kind = kind;
  q.text = to_lower(text);
  return q;
}

nlohmann::json context_to_json(const ContextCandidate& c) {
  nlohmann::json names = nlohmann::json::array();
  for(const auto& n : c.names) names.push_back({{"owner", n.owner}, {"name", n.name}});
  return {
    {"tree", c.tree.to_hex()},
    {"replicas", c.replica_count},
    {"display_name", c.display_name},
    {"similarity", c.similarity},
    {"names", names}
  };
}

ContextCandidate context_from_json(const nlohmann::json& j) {
  ContextCandidate c;
  c.tree = parse_hash_field(j, "tree");
  c.replica_count = j.value("replicas", std::size_t{0});
  c.display_name = j.value("display_name", "");
  c.similarity = j.value("similarity", 0.0);
  for(const auto& n : j.value("names", nlohmann::json::array())) {
    c.names.push_back({n.value("owner", ""), n.value("name", "")});
  }
  return c;
}

nlohmann::json subtree_to_json(const SubtreeEntry& e) {
  nlohmann::json j = {
    {"name", e.name},
    {"kind", entry_kind_name(e.kind)},
    {"hash", e.hash.to_hex()},
    {"size", e.size}
  };
  if(e.kind == EntryKind::Tree) {
    nlohmann::json children = nlohmann::json::array();
    for(const auto& child : e.children) children.push_back(subtree_to_json(child));
    j["children"] = children;
  }
  return j;
}

SubtreeEntry subtree_from_json(const nlohmann::json& j) {
  SubtreeEntry e;
  e.name = j.value("name", "");
  e.kind = j.value("kind", "file") == "dir" ? EntryKind::Tree : EntryKind::File;
  e.hash = parse_hash_field(j, "hash");
  e.size = j.value("size", 0ULL);
  for(const auto& child : j.value("children", nlohmann::json::array())) {
    e.children.push_back(subtree_from_json(child));
  }
  return e;
}

SubtreeEntry build_subtree(const IndexState& state,
                           const std::string& name,
                           const TreeHash& hash,
                           std::size_t& file_count) {
  SubtreeEntry out;
  out.name = name;
  out.kind = EntryKind::Tree;
  out.hash = hash;
  const TreeNode* node = state.node(hash);
  if(!node) return out;
  out.size = node->total_size();
  for(const auto& entry : node->entries) {
    if(entry.kind == EntryKind::Tree) {
      out.children.push_back(build_subtree(state, entry.name, entry.hash, file_count));
    } else {
      out.children.push_back({entry.name, EntryKind::File, entry.hash, entry.size, {}});
      ++file_count;
    }
  }
  return out;
}

template<typename Match>
double best_similarity(const Match& m) {
  return m.contexts.empty() ? 0.0 : m.contexts.front().similarity;
}

} // namespace

const char* query_kind_name(QueryKind kind) {
  switch(kind) {
    case QueryKind::Hash: return "hash";
    case QueryKind::Name: return "name";
    case QueryKind::Extension: return "ext";
    case QueryKind::Folder: return "folder";
  }
  return "name";
}

Query classify_query(const std::string& raw) {
  std::string text = trim_copy(raw);
  if(text.empty()) return text_query(QueryKind::Name, text);
  auto lowered = to_lower(text);
  if(starts_with(lowered, "hash:")) return hash_query(text.substr(5));
  if(starts_with(lowered, "ext:")) return text_query(QueryKind::Extension, text.substr(4));
  if(starts_with(lowered, "folder:")) return text_query(QueryKind::Folder, text.substr(7));
  if(starts_with(lowered, "name:")) return text_query(QueryKind::Name, text.substr(5));
  if(is_hex_digest(text)) return hash_query(text);
  if((text.front() == '.' || starts_with(text, "*.")) &&
     text.find_first_of(" /") == std::string::npos &&
     std::count(text.begin(), text.end(), '.') == 1) {
    return text_query(QueryKind::Extension, text);
  }
  if(text.size() > 1 && text.back() == '/') {
    return text_query(QueryKind::Folder, text.substr(0, text.size() - 1));
  }
  return text_query(QueryKind::Name, text);
}

Query make_query(const std::string& kind, const std::string& text) {
  auto k = to_lower(kind);
  if(k.empty() || k == "auto") return classify_query(text);
  if(k == "hash") return hash_query(text);
  if(k == "name") return text_query(QueryKind::Name, trim_copy(text));
  if(k == "ext" || k == "extension") return text_query(QueryKind::Extension, trim_copy(text));
  if(k == "folder") return text_query(QueryKind::Folder, trim_copy(text));
  throw QueryError("unknown query kind '" + kind + "'");
}

const ContentHash& result_hash(const SearchResult& result) {
  return std::visit([](const auto& m) -> const ContentHash& { return m.hash; }, result);
}

SearchEngine::SearchEngine(const TreeStore& store, SearchOptions options, std::shared_ptr<Logger> logger)
  : store_(store),
    options_(options),
    logger_(logger ? std::move(logger) : store.logger()) {}

FileMatch SearchEngine::make_file_match(const IndexState& state,
                                        const ContentHash& hash,
                                        const std::string& query) const {
  FileMatch match;
  const auto* entry = state.find(hash);
  match.hash = hash;
  match.size = entry ? entry->size : 0;
  match.contexts = rank_contexts(state, hash, query, store_.options().tie_break);
  match.ambiguous = is_ambiguous(match.contexts);
  match.seeders = state.online_owner_count(hash);
  if(match.contexts.empty()) return match;

  const auto& best = match.contexts.front();
  match.display_name = best.display_name;
  if(const TreeNode* folder = state.node(best.tree)) {
    for(const auto& sibling : folder->entries) {
      if(sibling.hash == hash && sibling.name == best.display_name) continue;
      ++match.sibling_total;
      if(match.siblings.size() < options_.sibling_limit) match.siblings.push_back(sibling);
    }
  }
  return match;
}

FolderMatch SearchEngine::make_folder_match(const IndexState& state,
                                            const ContentHash& hash,
                                            const std::string& query) const {
  FolderMatch match;
  match.hash = hash;
  match.contexts = rank_contexts(state, hash, query, store_.options().tie_break);
  match.ambiguous = is_ambiguous(match.contexts);
  match.seeders = state.online_owner_count(hash);
  match.display_name = match.contexts.empty() ? query : match.contexts.front().display_name;
  match.tree = build_subtree(state, match.display_name, hash, match.file_count);
  match.total_size = match.tree.size;
  return match;
}

std::vector<SearchResult> SearchEngine::search(const Query& query) const {
  auto results = store_.read([&](const IndexState& state){
    std::vector<SearchResult> out;
    if(query.kind == QueryKind::Hash) {
      const auto* entry = state.find(query.hash);
      if(!entry) return out;
      if(entry->kind == EntryKind::Tree) out.emplace_back(make_folder_match(state, query.hash, ""));
      else out.emplace_back(make_file_match(state, query.hash, ""));
      return out;
    }

    if(query.text.empty()) return out;
    for(const auto& [hash, entry] : state.entries()) {
      bool wants_tree = query.kind == QueryKind::Folder;
      if((entry.kind == EntryKind::Tree) != wants_tree) continue;
      bool matched = std::any_of(entry.refs.begin(), entry.refs.end(), [&](const IndexRef& ref){
        auto name = to_lower(ref.name);
        if(query.kind == QueryKind::Extension) return extension_of(name) == query.text;
        return name.find(query.text) != std::string::npos;
      });
      if(!matched) continue;
      if(wants_tree) out.emplace_back(make_folder_match(state, hash, query.text));
      else out.emplace_back(make_file_match(state, hash, query.text));
    }
    return out;
  });

  std::sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b){
    auto key = [](const SearchResult& r){
      return std::visit([](const auto& m){
        return std::make_tuple(m.seeders, best_similarity(m), m.display_name);
      }, r);
    };
    auto ka = key(a);
    auto kb = key(b);
    if(std::get<0>(ka) != std::get<0>(kb)) return std::get<0>(ka) > std::get<0>(kb);
    if(std::get<1>(ka) != std::get<1>(kb)) return std::get<1>(ka) > std::get<1>(kb);
    if(std::get<2>(ka) != std::get<2>(kb)) return std::get<2>(ka) < std::get<2>(kb);
    return result_hash(a) < result_hash(b);
  });
  if(results.size() > options_.max_results) {
    results.resize(options_.max_results);
  }
  logger_->debug("search {} '{}' -> {} result{}",
                 query_kind_name(query.kind), query.text, results.size(), results.size() == 1 ? "" : "s");
  return results;
}

nlohmann::json search_result_to_json(const SearchResult& result) {
  nlohmann::json j;
  if(const auto* file = std::get_if<FileMatch>(&result)) {
    j["type"] = "file";
    j["hash"] = file->hash.to_hex();
    j["size"] = file->size;
    j["display_name"] = file->display_name;
    j["ambiguous"] = file->ambiguous;
    j["seeders"] = file->seeders;
    nlohmann::json contexts = nlohmann::json::array();
    for(const auto& c : file->contexts) contexts.push_back(context_to_json(c));
    j["contexts"] = contexts;
    TreeNode siblings;
    siblings.entries = file->siblings;
    j["siblings"] = tree_node_to_json(siblings);
    j["sibling_total"] = file->sibling_total;
    return j;
  }
  const auto& folder = std::get<FolderMatch>(result);
  j["type"] = "folder";
  j["hash"] = folder.hash.to_hex();
  j["display_name"] = folder.display_name;
  j["ambiguous"] = folder.ambiguous;
  j["seeders"] = folder.seeders;
  nlohmann::json contexts = nlohmann::json::array();
  for(const auto& c : folder.contexts) contexts.push_back(context_to_json(c));
  j["contexts"] = contexts;
  j["tree"] = subtree_to_json(folder.tree);
  j["total_size"] = folder.total_size;
  j["file_count"] = folder.file_count;
  return j;
}

SearchResult search_result_from_json(const nlohmann::json& j) {
  try {
    auto type = j.at("type").get<std::string>();
    std::vector<ContextCandidate> contexts;
    for(const auto& c : j.value("contexts", nlohmann::json::array())) contexts.push_back(context_from_json(c));
    if(type == "file") {
      FileMatch file;
      file.hash = parse_hash_field(j, "hash");
      file.size = j.value("size", 0ULL);
      file.display_name = j.value("display_name", "");
      file.ambiguous = j.value("ambiguous", false);
      file.seeders = j.value("seeders", std::size_t{0});
      file.contexts = std::move(contexts);
      file.siblings = tree_node_from_json(j.value("siblings", nlohmann::json::array())).entries;
      file.sibling_total = j.value("sibling_total", std::size_t{0});
      return file;
    }
    if(type == "folder") {
      FolderMatch folder;
      folder.hash = parse_hash_field(j, "hash");
      folder.display_name = j.value("display_name", "");
      folder.ambiguous = j.value("ambiguous", false);
      folder.seeders = j.value("seeders", std::size_t{0});
      folder.contexts = std::move(contexts);
      folder.tree = subtree_from_json(j.at("tree"));
      folder.total_size = j.value("total_size", 0ULL);
      folder.file_count = j.value("file_count", std::size_t{0});
      return folder;
    }
    throw ProtocolError("unknown search result type '" + type + "'");
  } catch(const nlohmann::json::exception& e) {
    throw ProtocolError(std::string("malformed search result: ") + e.what());
  }
}
