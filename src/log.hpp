#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Where a line ends up when no listener claims it. Print channels carry no
// timestamp and are meant for command output.
enum class LogChannel { Info, Warn, Error, Debug, Print, PrintErr };

const char* log_channel_name(LogChannel channel);

struct LogOptions {
  bool verbose = false;
  // Every line is also appended here when set, console passthrough or not.
  std::filesystem::path file;
  std::size_t file_max_bytes = 8 * 1024 * 1024;
  std::size_t file_rotations = 3;
};

void init(const LogOptions& options);
inline void init(bool verbose = false) {
  LogOptions options;
  options.verbose = verbose;
  init(options);
}
// Off silences the console sinks only; the log file keeps recording.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Named component logger ("transfer", "tree-store", a node id). Listeners see
// every line first; a line no listener claims goes to the shared sinks.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  void set_name(std::string name);
  std::string name() const;

  void set_level(spdlog::level::level_enum level) { level_.store(level); }
  spdlog::level::level_enum level() const { return level_.load(); }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    auto level = channel_level(channel);
    if(level < level_.load()) return;
    emit(channel, level, fmt::format(fmt, std::forward<Args>(args)...));
  }

  static spdlog::level::level_enum channel_level(LogChannel channel);

private:
  void emit(LogChannel channel, spdlog::level::level_enum level, const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  mutable std::mutex m_;
  std::string name_;
  std::atomic<spdlog::level::level_enum> level_{spdlog::level::trace};
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  LogListenerHandle next_listener_ = 1;
};

namespace detail {
// `origin` is the component name, empty for process-level output.
void write_to_sinks(LogChannel channel, const std::string& origin, const std::string& message);

template<typename... Args>
void write_line(Logger* logger, LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->write(channel, fmt, std::forward<Args>(args)...);
    return;
  }
  write_to_sinks(channel, std::string(), fmt::format(fmt, std::forward<Args>(args)...));
}
} // namespace detail

// Free helpers for code that may or may not have a component logger at hand.
template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::write_line(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::write_line(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::write_line(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::write_line(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::write_line(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::write_line(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
