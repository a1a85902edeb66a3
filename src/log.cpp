#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <vector>

namespace {

constexpr const char* kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

// Console loggers indexed by LogChannel, plus the optional file logger.
struct Sinks {
  std::array<std::shared_ptr<spdlog::logger>, 6> console;
  std::shared_ptr<spdlog::logger> file;
  std::mutex file_mutex;
};

std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> console_logger(const std::string& name, spdlog::sink_ptr sink, const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_level(spdlog::level::trace);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

Sinks& sinks() {
  static Sinks* instance = []{
    auto* s = new Sinks();
    auto out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto err = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto status = console_logger("treeswarm", out, kConsolePattern);
    auto errors = console_logger("treeswarm.error", err, kConsolePattern);
    s->console[static_cast<std::size_t>(LogChannel::Info)] = status;
    s->console[static_cast<std::size_t>(LogChannel::Warn)] = status;
    s->console[static_cast<std::size_t>(LogChannel::Debug)] = status;
    s->console[static_cast<std::size_t>(LogChannel::Error)] = errors;
    s->console[static_cast<std::size_t>(LogChannel::Print)] =
      console_logger("treeswarm.out", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v");
    s->console[static_cast<std::size_t>(LogChannel::PrintErr)] =
      console_logger("treeswarm.err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v");
    status->set_level(spdlog::level::info);
    return s;
  }();
  return *instance;
}

std::string with_origin(const std::string& origin, const std::string& message) {
  return origin.empty() ? message : fmt::format("[{}] {}", origin, message);
}

} // namespace

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

void init(const LogOptions& options) {
  auto& s = sinks();
  auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  s.console[static_cast<std::size_t>(LogChannel::Info)]->set_level(level);

  std::lock_guard lg(s.file_mutex);
  s.file.reset();
  if(!options.file.empty()) {
    std::error_code ec;
    if(options.file.has_parent_path()) {
      std::filesystem::create_directories(options.file.parent_path(), ec);
    }
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        options.file.string(), options.file_max_bytes, options.file_rotations);
      sink->set_pattern(kFilePattern);
      s.file = std::make_shared<spdlog::logger>("treeswarm.file", std::move(sink));
      s.file->set_level(level);
      s.file->flush_on(spdlog::level::info);
    } catch(const spdlog::spdlog_ex& e) {
      s.console[static_cast<std::size_t>(LogChannel::Error)]->error(
        "Cannot open log file {}: {}", options.file.string(), e.what());
    }
  }
  spdlog::set_default_logger(s.console[static_cast<std::size_t>(LogChannel::Info)]);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

void Logger::set_name(std::string name) {
  std::lock_guard lg(m_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard lg(m_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard lg(m_);
  auto id = next_listener_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lg(m_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard lg(m_);
  listeners_.clear();
}

spdlog::level::level_enum Logger::channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void Logger::emit(LogChannel channel, spdlog::level::level_enum level, const std::string& message) {
  std::string origin;
  std::vector<ListenerBinding> listeners;
  {
    std::lock_guard lg(m_);
    origin = name_;
    listeners.reserve(listeners_.size());
    for(const auto& [id, binding] : listeners_) listeners.push_back(binding);
  }

  const std::string channel_name = origin.empty()
    ? std::string(log_channel_name(channel))
    : origin + ":" + log_channel_name(channel);
  bool claimed = false;
  for(auto& binding : listeners) {
    try {
      if(binding.callback(binding.user_data, channel_name, level, message)) claimed = true;
    } catch(const std::exception& e) {
      detail::write_to_sinks(LogChannel::Error, origin, fmt::format("log listener threw: {}", e.what()));
    }
  }
  if(!claimed) detail::write_to_sinks(channel, origin, message);
}

namespace detail {

void write_to_sinks(LogChannel channel, const std::string& origin, const std::string& message) {
  auto& s = sinks();
  auto level = Logger::channel_level(channel);
  {
    std::lock_guard lg(s.file_mutex);
    if(s.file) s.file->log(level, with_origin(origin, message));
  }
  if(!log_passthrough()) return;
  bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  s.console[static_cast<std::size_t>(channel)]->log(level, plain ? message : with_origin(origin, message));
}

} // namespace detail
