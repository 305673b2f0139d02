#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

enum class LogChannel { Debug, Info, Warn, Error, Print, PrintErr };

const char* to_string(LogChannel channel);
spdlog::level::level_enum level_of(LogChannel channel);

// Sets up the stdout/stderr sinks on first use; later calls only move the level.
void init_logging(bool verbose = false);

// When false, lines nobody's listener handled are dropped instead of
// reaching the console sinks.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Named log source. Lines go to this logger's listeners first, then up the
// parent chain, and only reach the console sinks if nobody claimed them.
class Logger : public std::enable_shared_from_this<Logger> {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name = std::string(), std::shared_ptr<Logger> parent = nullptr);

  // "<name>/<scope>", chained to this logger.
  std::shared_ptr<Logger> child(const std::string& scope);

  const std::string& name() const { return name_; }
  const std::shared_ptr<Logger>& parent() const { return parent_; }

  // Lines below the threshold (here or on any parent) are never formatted.
  void set_threshold(spdlog::level::level_enum level);
  bool enabled(spdlog::level::level_enum level) const;

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if(!enabled(level_of(channel))) return;
    deliver(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

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

private:
  void deliver(LogChannel channel, const std::string& message);
  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::shared_ptr<Logger> parent_;
  std::atomic<int> threshold_{spdlog::level::trace};
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {

void emit(LogChannel channel, const std::string& scope, const std::string& message);

template<typename... Args>
void route(Logger* logger, LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->write(channel, fmt, std::forward<Args>(args)...);
    return;
  }
  emit(channel, std::string(), fmt::format(fmt, std::forward<Args>(args)...));
}

} // namespace detail

// Free helpers for code that may run without a logger (settings, CLI).
template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
