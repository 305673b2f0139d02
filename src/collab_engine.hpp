#pragma once

#include <asio.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"

class CollabService;
class Connection;
class IdentityVerifier;
class PersistenceSink;
class SessionRegistry;
class SettingsManager;

class CollabEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    bool handle_signals = false;
    // Overrides identity_file when set.
    std::shared_ptr<IdentityVerifier> identity;
  };

  CollabEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~CollabEngine();

  void start();
  // Blocks until stop() or a handled signal.
  void run();
  void start_background();
  void stop();

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<SessionRegistry> registry() const { return registry_; }
  std::shared_ptr<CollabService> service() const { return service_; }

  struct Stats {
    std::size_t active_sessions = 0;
    std::size_t connections = 0;
    std::size_t participants = 0;
    uint64_t committed_operations = 0;
  };

  Stats stats() const;

  uint16_t listen_port() const { return listen_port_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void schedule_sweep();
  void ensure_workspace() const;
  void build_components();
  void on_connection_closed(const std::string& connection_id);

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  asio::io_context io_;
  std::vector<std::thread> io_threads_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::steady_timer> sweep_timer_;
  std::unique_ptr<asio::signal_set> signals_;
  std::shared_ptr<PersistenceSink> persistence_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<CollabService> service_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex connections_m_;
  std::map<std::string, std::weak_ptr<Connection>> connections_;

  bool started_ = false;
  std::string listen_ip_;
  uint16_t listen_port_ = 0;
  int io_thread_count_ = 1;
  int sweep_interval_ms_ = 1000;
  std::size_t outbound_limit_bytes_ = Connection::kMaxQueuedBytes;
};
