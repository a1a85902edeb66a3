#include "consensus.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <vector>

#include "tree_store.hpp"
#include "utils.hpp"

namespace {

constexpr double kSimilarityEpsilon = 1e-9;

std::size_t edit_distance(const std::string& a, const std::string& b) {
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> cur(b.size() + 1);
  for(std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;
  for(std::size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for(std::size_t j = 1; j <= b.size(); ++j) {
      std::size_t substitute = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, substitute});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

bool same_score(const ContextCandidate& a, const ContextCandidate& b) {
  return a.replica_count == b.replica_count &&
         std::fabs(a.similarity - b.similarity) < kSimilarityEpsilon;
}

} // namespace

const char* tie_break_policy_name(TieBreakPolicy policy) {
  switch(policy) {
    case TieBreakPolicy::QueryName: return "query";
    case TieBreakPolicy::Lexicographic: return "lexicographic";
    case TieBreakPolicy::MostRecent: return "recent";
  }
  return "query";
}

std::optional<TieBreakPolicy> parse_tie_break_policy(const std::string& text) {
  auto lowered = to_lower(text);
  if(lowered == "query" || lowered == "query_name") return TieBreakPolicy::QueryName;
  if(lowered == "lexicographic" || lowered == "lex") return TieBreakPolicy::Lexicographic;
  if(lowered == "recent" || lowered == "most_recent") return TieBreakPolicy::MostRecent;
  return std::nullopt;
}

double name_similarity(const std::string& a, const std::string& b) {
  if(a.empty() && b.empty()) return 1.0;
  auto la = to_lower(a);
  auto lb = to_lower(b);
  std::size_t longest = std::max(la.size(), lb.size());
  return 1.0 - static_cast<double>(edit_distance(la, lb)) / static_cast<double>(longest);
}

std::vector<ContextCandidate> rank_contexts(const IndexState& state,
                                            const ContentHash& target,
                                            const std::string& query,
                                            TieBreakPolicy policy) {
  std::vector<ContextCandidate> out;
  const auto* entry = state.find(target);
  if(!entry) return out;

  std::map<TreeHash, ContextCandidate> by_tree;
  for(const auto& ref : entry->refs) {
    auto& candidate = by_tree[ref.container];
    candidate.tree = ref.container;
    candidate.names.push_back({ref.owner, ref.name});
  }

  for(auto& [tree, candidate] : by_tree) {
    if(tree.is_zero()) {
      std::set<std::string> owners;
      for(const auto& n : candidate.names) owners.insert(n.owner);
      candidate.replica_count = owners.size();
    } else {
      candidate.replica_count = state.replica_count(tree);
    }

    candidate.display_name.clear();
    candidate.similarity = 0.0;
    for(const auto& n : candidate.names) {
      double score = query.empty() ? 0.0 : name_similarity(n.name, query);
      bool better = candidate.display_name.empty() ||
                    score > candidate.similarity + kSimilarityEpsilon ||
                    (std::fabs(score - candidate.similarity) < kSimilarityEpsilon &&
                     n.name < candidate.display_name);
      if(better) {
        candidate.display_name = n.name;
        candidate.similarity = score;
      }
    }
    if(candidate.display_name.empty()) {
      candidate.display_name = query;
    }

    const auto* container = state.find(tree.is_zero() ? target : tree);
    if(container) {
      for(const auto& owner : container->owners()) {
        auto when = state.last_declared(owner);
        if(when && *when > candidate.declared_at) candidate.declared_at = *when;
      }
    }
    out.push_back(std::move(candidate));
  }

  std::sort(out.begin(), out.end(), [&](const ContextCandidate& a, const ContextCandidate& b){
    if(a.replica_count != b.replica_count) return a.replica_count > b.replica_count;
    if(std::fabs(a.similarity - b.similarity) >= kSimilarityEpsilon) return a.similarity > b.similarity;
    switch(policy) {
      case TieBreakPolicy::QueryName:
        break;
      case TieBreakPolicy::Lexicographic:
        if(a.display_name != b.display_name) return a.display_name < b.display_name;
        break;
      case TieBreakPolicy::MostRecent:
        if(a.declared_at != b.declared_at) return a.declared_at > b.declared_at;
        break;
    }
    return a.tree < b.tree;
  });
  return out;
}

bool is_ambiguous(const std::vector<ContextCandidate>& ranked) {
  return ranked.size() >= 2 && same_score(ranked[0], ranked[1]);
}
