#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {

struct Sinks {
  std::shared_ptr<spdlog::logger> events;    // debug and info
  std::shared_ptr<spdlog::logger> problems;  // warn and error
  std::shared_ptr<spdlog::logger> console;
  std::shared_ptr<spdlog::logger> console_err;
};

std::shared_ptr<spdlog::logger> make_sink_logger(const std::string& name,
                                                 spdlog::sink_ptr sink,
                                                 const char* pattern,
                                                 spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

Sinks& sinks() {
  static Sinks s = []{
    const char* stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    Sinks out;
    out.events = make_sink_logger("collab.events",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), stamped, spdlog::level::warn);
    out.problems = make_sink_logger("collab.problems",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), stamped, spdlog::level::warn);
    out.console = make_sink_logger("collab.console",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v", spdlog::level::info);
    out.console_err = make_sink_logger("collab.console_err",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v", spdlog::level::err);
    return out;
  }();
  return s;
}

std::atomic<bool> g_log_passthrough{true};

} // namespace

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug:    return "debug";
    case LogChannel::Info:     return "info";
    case LogChannel::Warn:     return "warn";
    case LogChannel::Error:    return "error";
    case LogChannel::Print:    return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug:    return spdlog::level::debug;
    case LogChannel::Info:     return spdlog::level::info;
    case LogChannel::Warn:     return spdlog::level::warn;
    case LogChannel::Error:    return spdlog::level::err;
    case LogChannel::Print:    return spdlog::level::info;
    case LogChannel::PrintErr: return spdlog::level::err;
  }
  return spdlog::level::info;
}

void init_logging(bool verbose) {
  auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.events->set_level(level);
  s.problems->set_level(spdlog::level::warn);
  s.console->set_level(spdlog::level::info);
  s.console_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(s.events);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger(std::string name, std::shared_ptr<Logger> parent)
  : name_(std::move(name)), parent_(std::move(parent)) {}

std::shared_ptr<Logger> Logger::child(const std::string& scope) {
  std::string name = name_.empty() ? scope : name_ + "/" + scope;
  return std::make_shared<Logger>(std::move(name), shared_from_this());
}

void Logger::set_threshold(spdlog::level::level_enum level) {
  threshold_.store(static_cast<int>(level), std::memory_order_relaxed);
}

bool Logger::enabled(spdlog::level::level_enum level) const {
  if(static_cast<int>(level) < threshold_.load(std::memory_order_relaxed)) return false;
  return !parent_ || parent_->enabled(level);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard lg(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard lg(listener_mutex_);
  listeners_.clear();
}

void Logger::deliver(LogChannel channel, const std::string& message) {
  std::string channel_name = name_.empty()
    ? std::string(to_string(channel))
    : name_ + ":" + to_string(channel);
  if(dispatch(channel_name, level_of(channel), message)) return;
  detail::emit(channel, name_, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard lg(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback(binding.user_data, channel, level, message)) handled = true;
    } catch(const std::exception& e) {
      detail::emit(LogChannel::Error, name_, fmt::format("log listener failed: {}", e.what()));
    }
  }
  if(!handled && parent_) {
    handled = parent_->dispatch(channel, level, message);
  }
  return handled;
}

namespace detail {

void emit(LogChannel channel, const std::string& scope, const std::string& message) {
  if(!log_passthrough()) return;
  auto& s = sinks();
  spdlog::logger* sink = s.events.get();
  switch(channel) {
    case LogChannel::Print:    sink = s.console.get(); break;
    case LogChannel::PrintErr: sink = s.console_err.get(); break;
    case LogChannel::Warn:
    case LogChannel::Error:    sink = s.problems.get(); break;
    default: break;
  }
  if(scope.empty()) {
    sink->log(level_of(channel), message);
  } else {
    sink->log(level_of(channel), fmt::format("[{}] {}", scope, message));
  }
}

} // namespace detail
