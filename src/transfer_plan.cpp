#include "transfer_plan.hpp"

#include "errors.hpp"

uint64_t TransferPlan::total_bytes() const {
  uint64_t total = 0;
  for(const auto& f : files) total += f.manifest.size;
  return total;
}

std::size_t TransferPlan::total_chunks() const {
  std::size_t total = 0;
  for(const auto& f : files) total += f.manifest.chunk_count();
  return total;
}

nlohmann::json transfer_plan_to_json(const TransferPlan& plan) {
  nlohmann::json j;
  j["target"] = plan.target.to_hex();
  j["context"] = plan.context.to_hex();
  j["kind"] = entry_kind_name(plan.target_kind);
  j["root_name"] = plan.root_name;
  nlohmann::json files = nlohmann::json::array();
  for(const auto& f : plan.files) {
    nlohmann::json entry = manifest_to_json(f.manifest);
    entry["path"] = f.relative_path;
    entry["hash"] = f.hash.to_hex();
    files.push_back(std::move(entry));
  }
  j["files"] = files;
  j["directories"] = plan.directories;
  return j;
}

namespace {

void check_relative_path(const std::string& path) {
  if(path.empty() || path.front() == '/') {
    throw ProtocolError("invalid relative path '" + path + "'");
  }
  std::size_t start = 0;
  while(start <= path.size()) {
    auto end = path.find('/', start);
    if(end == std::string::npos) end = path.size();
    if(!is_valid_entry_name(path.substr(start, end - start))) {
      throw ProtocolError("invalid relative path '" + path + "'");
    }
    start = end + 1;
  }
}

} // namespace

TransferPlan transfer_plan_from_json(const nlohmann::json& j) {
  if(!j.is_object()) throw ProtocolError("transfer plan must be an object");
  TransferPlan plan;
  try {
    plan.target = parse_hash_field(j, "target");
    plan.context = parse_hash_field(j, "context");
    plan.target_kind = j.value("kind", "file") == "dir" ? EntryKind::Tree : EntryKind::File;
    plan.root_name = j.value("root_name", "");
    if(plan.target_kind == EntryKind::Tree && !is_valid_entry_name(plan.root_name)) {
      throw ProtocolError("invalid root name '" + plan.root_name + "'");
    }
    for(const auto& f : j.at("files")) {
      PlannedFile file;
      file.relative_path = f.at("path").get<std::string>();
      check_relative_path(file.relative_path);
      file.hash = parse_hash_field(f, "hash");
      file.manifest = manifest_from_json(f);
      if(file.manifest.chunk_count() != file.manifest.expected_chunk_count()) {
        throw ProtocolError("chunk list does not cover " + file.relative_path);
      }
      plan.files.push_back(std::move(file));
    }
    if(j.contains("directories")) {
      plan.directories = j.at("directories").get<std::vector<std::string>>();
      for(const auto& d : plan.directories) check_relative_path(d);
    }
  } catch(const nlohmann::json::exception& e) {
    throw ProtocolError(std::string("malformed transfer plan: ") + e.what());
  }
  return plan;
}
