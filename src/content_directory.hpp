#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "transfer_plan.hpp"

enum class PeerStatus { Online, Offline };

inline const char* peer_status_name(PeerStatus status) {
  return status == PeerStatus::Online ? "online" : "offline";
}

struct PeerRecord {
  std::string owner;
  std::string address; // host:port serving chunks, empty when unknown
  PeerStatus status = PeerStatus::Online;
  std::set<TreeHash> roots;
  std::chrono::system_clock::time_point last_seen{};
};

// Where a transfer learns what to fetch and from whom. Implemented in-process
// by TreeStore and remotely by TrackerClient.
class ContentDirectory {
public:
  virtual ~ContentDirectory() = default;

  // nullopt when the target is unknown or not inside `context`.
  virtual std::optional<TransferPlan> plan_transfer(const ContentHash& target,
                                                    const TreeHash& context) = 0;
  // Online peers that declared `file`.
  virtual std::vector<PeerRecord> seeders(const FileHash& file) = 0;
};
