#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

// Setting types: "bool", "int", "string", "size" (byte count with an optional
// K/M/G suffix) and "enum" (one of "choices"). "min"/"max" bound int and size
// settings.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","role"},                  {"aliases", {"r"}},              {"type","enum"},   {"choices", {"peer","tracker"}}, {"default","peer"}, {"description","Run as a sharing peer or as the tracker"}, {"persistent", true}},
  {{"key","listen_port"},           {"aliases", {"lp"}},             {"type","int"},    {"default",9000}, {"min",0}, {"max",65535}, {"description","TCP port to listen on (0 = any)"}, {"persistent", true}},
  {{"key","listen_ip"},             {"aliases", {"li"}},             {"type","string"}, {"default","127.0.0.1"},{"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","tracker"},               {"aliases", {"t"}},              {"type","string"}, {"default","127.0.0.1:9000"}, {"description","Tracker host:port"}, {"persistent", true}},
  {{"key","peer_id"},               {"aliases", {"id"}},             {"type","string"}, {"default",""},        {"description","Owner identity announced to the tracker"}, {"persistent", true}},
  {{"key","share"},                 {"aliases", {"s"}},              {"type","string"}, {"default",""},        {"description","Directory to index and declare"}, {"persistent", true}},
  {{"key","download_dir"},          {"aliases", {"dd","downloads"}}, {"type","string"}, {"default","downloads"}, {"description","Where finished transfers are materialized"}, {"persistent", true}},
  {{"key","store_dir"},             {"aliases", {"sd"}},             {"type","string"}, {"default",".treeswarm/store"}, {"description","Chunk stores of unfinished transfers"}, {"persistent", true}},
  {{"key","chunk_size"},            {"aliases", {"cs"}},             {"type","size"},   {"default",262144}, {"min",1}, {"max",16777216}, {"description","Chunk size used when indexing"}, {"persistent", true}},
  {{"key","max_concurrent_chunks"}, {"aliases", {"mcc"}},            {"type","int"},    {"default",8}, {"min",1},  {"description","In-flight chunk requests per transfer"}, {"persistent", true}},
  {{"key","max_chunks_per_peer"},   {"aliases", {"mcp"}},            {"type","int"},    {"default",2}, {"min",0},  {"description","In-flight chunk requests per peer and transfer (0 = unlimited)"}, {"persistent", true}},
  {{"key","max_active_transfers"},  {"aliases", {"mat"}},            {"type","int"},    {"default",2}, {"min",0},  {"description","Transfers downloading at once (0 = unlimited)"}, {"persistent", true}},
  {{"key","transfer_rate_limit"},   {"aliases", {"trl"}},            {"type","size"},   {"default",0},         {"description","Bytes/sec per transfer (0 = unlimited)"}, {"persistent", true}},
  {{"key","global_rate_limit"},     {"aliases", {"grl"}},            {"type","size"},   {"default",0},         {"description","Bytes/sec across all transfers (0 = unlimited)"}, {"persistent", true}},
  {{"key","max_chunk_attempts"},    {"aliases", {"mca"}},            {"type","int"},    {"default",4}, {"min",1},  {"description","Failed fetches tolerated per chunk"}, {"persistent", true}},
  {{"key","verify_threads"},        {"aliases", {"vt"}},             {"type","int"},    {"default",2}, {"min",1},  {"description","Chunk verification workers"}, {"persistent", true}},
  {{"key","request_timeout_ms"},    {"aliases", {"rt"}},             {"type","int"},    {"default",30000}, {"min",1}, {"description","Milliseconds before an unanswered request drops the peer"}, {"persistent", true}},
  {{"key","owner_expiry_seconds"},  {"aliases", {"oe"}},             {"type","int"},    {"default",300}, {"min",0}, {"description","Seconds an offline owner keeps its declarations"}, {"persistent", true}},
  {{"key","tie_break_policy"},      {"aliases", {"tb"}},             {"type","enum"},   {"choices", {"query","lexicographic","recent"}}, {"default","query"}, {"description","Context tie-break when replica counts match"}, {"persistent", true}},
  {{"key","sibling_summary_limit"}, {"aliases", {"ssl"}},            {"type","int"},    {"default",8}, {"min",0},  {"description","Siblings listed per file match"}, {"persistent", true}},
  {{"key","command"},               {"aliases", {"c"}},              {"type","enum"},   {"choices", {"serve","index","search","get","all","lookup"}}, {"default","serve"}, {"description","What to do once connected"}, {"persistent", false}},
  {{"key","target"},                {"aliases", {"q"}},              {"type","string"}, {"default",""},        {"description","Query, or hash to fetch/look up"}, {"persistent", false}},
  {{"key","context"},               {"aliases", {"ctx"}},            {"type","string"}, {"default",""},        {"description","Enclosing folder hash for get"}, {"persistent", false}},
  {{"key","log_file"},              {"aliases", {"lf"}},             {"type","string"}, {"default",""},        {"description","Also append log lines to this file"}, {"persistent", true}},
  {{"key","verbose"},               {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                  {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                  {"aliases", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Layered configuration: specification defaults, then the settings file, then
// TREESWARM_* environment variables, then the command line.
class SettingsManager {
public:
  static constexpr const char* kEnvironmentPrefix = "TREESWARM_";

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  // Overrides each setting whose <prefix><KEY> variable is set ("TREESWARM_LISTEN_PORT").
  // Invalid values are reported and skipped. Returns how many were applied.
  std::size_t apply_environment(const std::string& prefix = kEnvironmentPrefix);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::optional<uint64_t> parse_size(const std::string& value);

private:
  enum class Type { Bool, Int, String, Size, Enum };

  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases; // lower-cased
    Type type = Type::String;
    nlohmann::json default_value;
    std::vector<std::string> choices;
    std::optional<int64_t> min;
    std::optional<int64_t> max;
    bool persistent = true;
  };

  static Type parse_type(const std::string& name);
  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void merge_from_json(const nlohmann::json& doc);
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  static bool within_bounds(const SettingSpec& spec, int64_t value, std::string& error);
  static nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error);

  nlohmann::json settings_ = nlohmann::json::object();
  std::vector<SettingSpec> specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline SettingsManager::Type SettingsManager::parse_type(const std::string& name) {
  if(name == "bool") return Type::Bool;
  if(name == "int") return Type::Int;
  if(name == "string") return Type::String;
  if(name == "size") return Type::Size;
  if(name == "enum") return Type::Enum;
  throw std::invalid_argument("unknown setting type '" + name + "'");
}

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      spec.aliases.push_back(to_lower(alias));
    }
    spec.type = parse_type(entry.at("type").get<std::string>());
    spec.default_value = entry.at("default");
    spec.choices = entry.value("choices", std::vector<std::string>{});
    if(entry.contains("min")) spec.min = entry.at("min").get<int64_t>();
    if(entry.contains("max")) spec.max = entry.at("max").get<int64_t>();
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specs_(build_setting_specs(specification)) {
  for(const auto& spec : specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  auto lowered = to_lower(token);
  auto it = std::find_if(specs_.begin(), specs_.end(), [&](const SettingSpec& spec){
    return to_lower(spec.key) == lowered ||
           std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end();
  });
  return it == specs_.end() ? nullptr : &*it;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == Type::Bool;
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(path.empty() || !in) return false;
  try {
    merge_from_json(nlohmann::json::parse(in));
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) {
    print_err(nullptr, "Settings file is not a JSON object, ignoring it");
    return;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline std::size_t SettingsManager::apply_environment(const std::string& prefix) {
  std::size_t applied = 0;
  for(const auto& spec : specs_) {
    std::string name = prefix + spec.key;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
    const char* value = std::getenv(name.c_str());
    if(!value) continue;
    std::string error;
    if(set_from_string(spec.key, value, error)) {
      ++applied;
    } else {
      print_err(nullptr, "Ignoring {}: {}", name, error);
    }
  }
  return applied;
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::within_bounds(const SettingSpec& spec, int64_t value, std::string& error) {
  if(spec.min && value < *spec.min) {
    error = "must be at least " + std::to_string(*spec.min);
    return false;
  }
  if(spec.max && value > *spec.max) {
    error = "must be at most " + std::to_string(*spec.max);
    return false;
  }
  return true;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  switch(spec.type) {
    case Type::Bool:
      if(value.is_boolean() || value.is_number_integer()) {
        settings_[spec.key] = value.is_boolean() ? value.get<bool>() : value.get<int64_t>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;
    case Type::Int:
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      if(!within_bounds(spec, value.get<int64_t>(), error)) return false;
      if(value.get<int64_t>() < std::numeric_limits<int>::min() ||
         value.get<int64_t>() > std::numeric_limits<int>::max()) {
        error = "out of range";
        return false;
      }
      settings_[spec.key] = value.get<int>();
      return true;
    case Type::Size: {
      std::optional<uint64_t> bytes;
      if(value.is_number_unsigned() || (value.is_number_integer() && value.get<int64_t>() >= 0)) {
        bytes = value.get<uint64_t>();
      } else if(value.is_string()) {
        bytes = parse_size(value.get<std::string>());
      }
      if(!bytes) {
        error = "expected a byte count such as 65536, 256K or 4M";
        return false;
      }
      if(!within_bounds(spec, static_cast<int64_t>(std::min<uint64_t>(*bytes, std::numeric_limits<int64_t>::max())), error)) return false;
      settings_[spec.key] = *bytes;
      return true;
    }
    case Type::String:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      settings_[spec.key] = value.get<std::string>();
      return true;
    case Type::Enum: {
      auto lowered = value.is_string() ? to_lower(value.get<std::string>()) : std::string();
      if(std::find(spec.choices.begin(), spec.choices.end(), lowered) != spec.choices.end()) {
        settings_[spec.key] = lowered;
        return true;
      }
      std::string joined;
      for(const auto& choice : spec.choices) {
        joined += (joined.empty() ? "" : "|") + choice;
      }
      error = "expected one of " + joined;
      return false;
    }
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) {
  error.clear();
  auto clean = trim_copy(value);
  switch(spec.type) {
    case Type::Bool: {
      auto v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
      if(v == "false" || v == "0" || v == "off" || v == "no") return false;
      error = "expected boolean (true|false|on|off)";
      return {};
    }
    case Type::Int:
      try {
        std::size_t used = 0;
        long long parsed = std::stoll(clean, &used);
        if(used == clean.size()) return parsed;
      } catch(const std::logic_error&) {
      }
      error = "expected integer";
      return {};
    case Type::Size:
      if(auto parsed = parse_size(clean)) return *parsed;
      error = "expected a byte count such as 65536, 256K or 4M";
      return {};
    case Type::String:
    case Type::Enum:
      return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::optional<uint64_t> SettingsManager::parse_size(const std::string& value) {
  auto clean = to_lower(trim_copy(value));
  if(clean.empty()) return std::nullopt;
  uint64_t multiplier = 1;
  switch(clean.back()) {
    case 'k': multiplier = 1024ULL; break;
    case 'm': multiplier = 1024ULL * 1024; break;
    case 'g': multiplier = 1024ULL * 1024 * 1024; break;
    default: break;
  }
  if(multiplier != 1) clean.pop_back();
  if(clean.empty() || !std::all_of(clean.begin(), clean.end(),
                                   [](unsigned char ch){ return std::isdigit(ch); })) {
    return std::nullopt;
  }
  try {
    return std::stoull(clean) * multiplier;
  } catch(const std::out_of_range&) {
    return std::nullopt;
  }
}
