#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "content_hash.hpp"

class IndexState;

// Applied after replica count and name similarity are equal.
enum class TieBreakPolicy { QueryName, Lexicographic, MostRecent };

const char* tie_break_policy_name(TieBreakPolicy policy);
std::optional<TieBreakPolicy> parse_tie_break_policy(const std::string& text);

struct ContextName {
  std::string owner;
  std::string name;
};

// One tree variant containing the requested content.
struct ContextCandidate {
  TreeHash tree; // zero when the content is itself a declared root
  std::size_t replica_count = 0;
  std::vector<ContextName> names;
  std::string display_name;
  double similarity = 0.0;
  std::chrono::system_clock::time_point declared_at{};
};

// Normalized, case-insensitive edit similarity in [0, 1].
double name_similarity(const std::string& a, const std::string& b);

// Every context of `target`, best first. Empty when the hash is unknown.
std::vector<ContextCandidate> rank_contexts(const IndexState& state,
                                            const ContentHash& target,
                                            const std::string& query,
                                            TieBreakPolicy policy);

// True when the two leading candidates cannot be told apart by replica count
// or name similarity and the caller should choose.
bool is_ambiguous(const std::vector<ContextCandidate>& ranked);
