#pragma once

#include "chunk_source.hpp"
#include "errors.hpp"
#include "indexer.hpp"
#include "log.hpp"
#include "swarm_node.hpp"
#include "tree_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace treeswarm::test {

// Fresh directory under the system temp dir, removed again on destruction.
class ScratchDir {
public:
  explicit ScratchDir(const std::string& name)
    : path_(std::filesystem::temp_directory_path() / ("treeswarm_" + name)) {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& child) const { return path_ / child; }

private:
  std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Deterministic, non-repeating-looking bytes so chunk digests differ.
inline std::string patterned_bytes(std::size_t size, uint32_t seed = 1) {
  std::string out(size, '\0');
  uint32_t state = seed * 2654435761u + 1;
  for(std::size_t i = 0; i < size; ++i) {
    state = state * 1664525u + 1013904223u;
    out[i] = static_cast<char>(state >> 24);
  }
  return out;
}

inline void write_config_before_start(const std::filesystem::path& workspace,
                                      const std::string& filename,
                                      const nlohmann::json& content) {
  auto config_dir = workspace / ".config";
  std::error_code ec;
  std::filesystem::create_directories(config_dir, ec);
  std::ofstream out(config_dir / filename, std::ios::trunc);
  if(out) {
    out << content.dump(2);
  }
}

inline bool expect(bool condition, const std::string& what) {
  if(!condition) {
    std::cout << "\n    expected: " << what << "\n";
  }
  return condition;
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, nullptr, handle});
  }

  void attach(SwarmNode& node, const std::string& label = std::string()) {
    auto handle = node.add_log_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({nullptr, &node, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
      if(attachment.node && attachment.handle != 0) {
        attachment.node->remove_log_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    SwarmNode* node = nullptr;
    LogListenerHandle handle = 0;
  };

  Logger::Listener make_listener(const std::string& label) {
    return [this, label](void*,
                         const std::string& channel,
                         spdlog::level::level_enum,
                         const std::string& message) {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!label.empty()) {
        lines_.emplace_back(label + ": " + message);
      } else {
        lines_.emplace_back(channel + ": " + message);
      }
      cv_.notify_all();
      return false;
    };
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// In-memory ChunkSource. Serves whole files it was given and can be told to
// corrupt, withhold, stall or drop chunks.
class FakeSeeder : public ChunkSource {
public:
  explicit FakeSeeder(std::string id) : id_(std::move(id)) {}

  const std::string& peer_id() const override { return id_; }

  void add_file(const FileHash& hash, std::string bytes, uint32_t chunk_size) {
    std::lock_guard<std::mutex> lock(m_);
    auto& file = files_[hash];
    file.bytes = std::move(bytes);
    file.chunk_size = chunk_size;
  }

  // Loads every file of an indexed share.
  void add_share(const IndexResult& result) {
    for(const auto& [hash, local] : result.local_files) {
      add_file(hash, read_file(local.path), local.manifest.chunk_size);
    }
  }

  // Flips a byte of the chunk. `times` replies are corrupted, then it heals.
  void corrupt(const FileHash& file, std::size_t index, std::size_t times = static_cast<std::size_t>(-1)) {
    std::lock_guard<std::mutex> lock(m_);
    corrupt_[{file, index}] = times;
  }

  // Not offered, and refused as unavailable when asked anyway.
  void withhold(const FileHash& file, std::size_t index) {
    std::lock_guard<std::mutex> lock(m_);
    withheld_.insert({file, index});
  }

  void serve_all() {
    std::lock_guard<std::mutex> lock(m_);
    withheld_.clear();
  }

  void set_delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(m_);
    delay_ = delay;
  }

  // Fetches block until release() or cancellation.
  void hold() {
    std::lock_guard<std::mutex> lock(m_);
    held_ = true;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(m_);
      held_ = false;
    }
    cv_.notify_all();
  }

  // After `fetches` successful replies every later fetch reports Disconnected.
  void disconnect_after(std::size_t fetches) {
    std::lock_guard<std::mutex> lock(m_);
    disconnect_after_ = fetches;
  }

  void set_unreachable(bool unreachable) {
    std::lock_guard<std::mutex> lock(m_);
    unreachable_ = unreachable;
  }

  // Every fetch throws a plain std::runtime_error, like a reply that fails to decode.
  void throw_on_fetch(std::string what) {
    std::lock_guard<std::mutex> lock(m_);
    throw_what_ = std::move(what);
  }

  std::vector<ChunkRequest> fetch_log() const {
    std::lock_guard<std::mutex> lock(m_);
    return log_;
  }

  std::size_t fetch_count() const {
    std::lock_guard<std::mutex> lock(m_);
    return log_.size();
  }

  std::size_t fetch_count(const FileHash& file, std::size_t index) const {
    std::lock_guard<std::mutex> lock(m_);
    return static_cast<std::size_t>(std::count_if(log_.begin(), log_.end(), [&](const ChunkRequest& r){
      return r.file == file && r.index == index;
    }));
  }

  std::size_t waiting() const {
    std::lock_guard<std::mutex> lock(m_);
    return waiting_;
  }

  std::vector<std::size_t> offer(const FileHash& file) override {
    std::lock_guard<std::mutex> lock(m_);
    if(unreachable_) throw PeerUnavailableError(id_, "unreachable");
    std::vector<std::size_t> out;
    auto it = files_.find(file);
    if(it == files_.end()) return out;
    for(std::size_t i = 0; i < it->second.chunk_count(); ++i) {
      if(!withheld_.count({file, i})) out.push_back(i);
    }
    return out;
  }

  ChunkReply fetch(const ChunkRequest& request, const CancelToken& cancel) override {
    ChunkReply reply;
    std::unique_lock<std::mutex> lock(m_);
    log_.push_back(request);
    ++waiting_;
    auto deadline = std::chrono::steady_clock::now() + delay_;
    while(held_ || std::chrono::steady_clock::now() < deadline) {
      if(is_cancelled(cancel)) break;
      cv_.wait_for(lock, std::chrono::milliseconds(5));
    }
    --waiting_;
    if(is_cancelled(cancel)) {
      reply.status = FetchStatus::Cancelled;
      return reply;
    }
    if(!throw_what_.empty()) {
      throw std::runtime_error(throw_what_);
    }
    if(unreachable_ || (disconnect_after_ && served_ >= *disconnect_after_)) {
      reply.status = FetchStatus::Disconnected;
      reply.error = id_ + " went away";
      return reply;
    }
    auto it = files_.find(request.file);
    if(it == files_.end() || withheld_.count({request.file, request.index}) ||
       request.offset + request.length > it->second.bytes.size()) {
      reply.status = FetchStatus::Unavailable;
      reply.error = "unavailable: not here";
      return reply;
    }
    const auto& bytes = it->second.bytes;
    reply.data.assign(bytes.begin() + static_cast<std::ptrdiff_t>(request.offset),
                      bytes.begin() + static_cast<std::ptrdiff_t>(request.offset + request.length));
    auto bad = corrupt_.find({request.file, request.index});
    if(bad != corrupt_.end() && bad->second > 0 && !reply.data.empty()) {
      reply.data[0] = static_cast<char>(reply.data[0] ^ 0x5a);
      --bad->second;
    }
    ++served_;
    reply.status = FetchStatus::Ok;
    return reply;
  }

private:
  struct File {
    std::string bytes;
    uint32_t chunk_size = 0;

    std::size_t chunk_count() const {
      if(chunk_size == 0) return 0;
      return (bytes.size() + chunk_size - 1) / chunk_size;
    }
  };

  std::string id_;
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::map<FileHash, File> files_;
  std::map<std::pair<FileHash, std::size_t>, std::size_t> corrupt_;
  std::set<std::pair<FileHash, std::size_t>> withheld_;
  std::chrono::milliseconds delay_{0};
  bool held_ = false;
  bool unreachable_ = false;
  std::optional<std::size_t> disconnect_after_;
  std::size_t served_ = 0;
  std::size_t waiting_ = 0;
  std::string throw_what_;
  std::vector<ChunkRequest> log_;
};

// A TreeStore plus one FakeSeeder per owner, standing in for a tracker and
// its peers.
class FakeSwarm {
public:
  FakeSwarm()
    : store_(TreeStoreOptions{}, std::make_shared<Logger>("tree-store")) {}

  std::shared_ptr<FakeSeeder> seed(const std::string& owner, const IndexResult& share) {
    store_.declare(owner, share.declaration);
    store_.register_peer(owner, "fake:" + owner);
    auto seeder = seeder_for(owner);
    seeder->add_share(share);
    return seeder;
  }

  std::shared_ptr<FakeSeeder> seeder_for(const std::string& owner) {
    std::lock_guard<std::mutex> lock(m_);
    auto& seeder = seeders_[owner];
    if(!seeder) seeder = std::make_shared<FakeSeeder>(owner);
    return seeder;
  }

  PeerPool::SourceFactory factory() {
    return [this](const PeerRecord& peer) -> std::shared_ptr<ChunkSource> {
      std::lock_guard<std::mutex> lock(m_);
      ++connects_;
      auto it = seeders_.find(peer.owner);
      if(it == seeders_.end()) throw PeerUnavailableError(peer.owner, "no such fake peer");
      return it->second;
    };
  }

  std::size_t connects() const {
    std::lock_guard<std::mutex> lock(m_);
    return connects_;
  }

  TreeStore& store() { return store_; }

private:
  TreeStore store_;
  mutable std::mutex m_;
  std::map<std::string, std::shared_ptr<FakeSeeder>> seeders_;
  std::size_t connects_ = 0;
};

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

inline int run_suite(const char* suite, const std::vector<TestCase>& tests, int argc, char** argv) {
  bool verbose = (std::getenv("TREESWARM_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("TREESWARM_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace treeswarm::test
