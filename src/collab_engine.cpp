#include "collab_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <stdexcept>

#include "collab_service.hpp"
#include "connection.hpp"
#include "identity.hpp"
#include "persistence.hpp"
#include "session_registry.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::vector<Role> roles_from_setting(const nlohmann::json& value) {
  if(!value.is_array()) {
    throw std::runtime_error("allowed_roles must be a JSON array");
  }
  std::vector<Role> roles;
  for(const auto& item : value) {
    auto role = item.is_string() ? role_from_string(item.get<std::string>()) : std::nullopt;
    if(!role) {
      throw std::runtime_error("Unknown role in allowed_roles: " + item.dump());
    }
    roles.push_back(*role);
  }
  return roles;
}

} // namespace

CollabEngine::CollabEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("collab-engine")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

CollabEngine::~CollabEngine() {
  stop();
}

void CollabEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
}

void CollabEngine::build_components() {
  RegistryConfig config;
  config.default_settings.allowed_roles = roles_from_setting(settings_->get<nlohmann::json>("allowed_roles"));
  config.default_settings.max_participants = static_cast<std::size_t>(settings_->get<int>("max_participants"));
  config.default_settings.auto_save = settings_->get<bool>("auto_save");
  config.default_settings.idle_timeout_seconds = settings_->get<int>("idle_timeout_seconds");
  std::string invalid = config.default_settings.validate(0);
  if(!invalid.empty()) {
    throw std::runtime_error("Invalid session defaults: " + invalid);
  }

  config.session.queue_depth = static_cast<std::size_t>(settings_->get<int>("queue_depth"));
  outbound_limit_bytes_ = static_cast<std::size_t>(settings_->get<int>("max_outbound_kb")) * 1024;
  config.session.concurrent_window = static_cast<uint64_t>(settings_->get<int>("concurrent_window"));
  config.session.position_gap = settings_->get<int>("position_gap");
  config.session.default_node_width = settings_->get<int>("default_node_width");
  config.session.default_node_height = settings_->get<int>("default_node_height");

  auto data_dir = settings_->get<std::string>("data_dir");
  if(data_dir.empty()) {
    persistence_ = std::make_shared<NullPersistence>();
  } else {
    std::filesystem::path dir(data_dir);
    if(dir.is_relative()) dir = options_.workspace_root / dir;
    persistence_ = std::make_shared<JsonlPersistence>(io_, dir, logger_);
    logger_->info("Persisting sessions under {}", dir.string());
  }

  std::shared_ptr<IdentityVerifier> identity = options_.identity;
  if(!identity) {
    auto identity_file = settings_->get<std::string>("identity_file");
    if(identity_file.empty()) {
      identity = std::make_shared<TrustingIdentityVerifier>();
    } else {
      std::filesystem::path path(identity_file);
      if(path.is_relative()) path = options_.workspace_root / path;
      auto tokens = std::make_shared<TokenIdentityVerifier>();
      std::string error;
      if(!tokens->load_from_file(path, error)) {
        logger_->error("Unable to load identity file {}: {}", path.string(), error);
        throw std::runtime_error("Invalid identity_file");
      }
      logger_->info("Loaded {} identity tokens", tokens->size());
      identity = tokens;
    }
  }

  registry_ = std::make_shared<SessionRegistry>(io_, config, persistence_, logger_);
  service_ = std::make_shared<CollabService>(registry_, identity, logger_);
}

void CollabEngine::start() {
  if(started_) return;

  ensure_workspace();

  if(settings_->settings_path().empty()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");
  }

  const bool verbose = settings_->get<bool>("verbose");
  init_logging(verbose);
  logger_->set_threshold(verbose ? spdlog::level::debug : spdlog::level::info);

  listen_ip_ = settings_->get<std::string>("listen_ip");
  int listen_port_value = settings_->get<int>("listen_port");
  if(listen_port_value < 0 || listen_port_value > 65535) {
    logger_->error("Invalid listen_port '{}'", listen_port_value);
    throw std::runtime_error("Invalid listen_port");
  }
  listen_port_ = static_cast<uint16_t>(listen_port_value);
  io_thread_count_ = std::max(1, settings_->get<int>("io_threads"));
  sweep_interval_ms_ = std::max(10, settings_->get<int>("sweep_interval_ms"));

  build_components();

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(listen_ip_);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", listen_ip_, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, listen_port_);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();

  if(listen_port_ == 0) {
    listen_port_ = acceptor_->local_endpoint().port();
  }
  started_ = true;
  logger_->info("Listening on {}:{}", listen_ip_, listen_port_);

  start_accept();

  sweep_timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_sweep();

  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& ec, int signo){
      if(ec) return;
      logger_->info("Signal {} received, shutting down", signo);
      io_.stop();
    });
  }
}

void CollabEngine::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(asio::make_strand(io_),
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->error("Accept error: {}", ec.message());
        }
      } else if(service_) {
        auto service = service_;
        auto conn = Connection::create_incoming(
          std::move(socket),
          [service](const std::shared_ptr<Connection>& c, const nlohmann::json& message){
            service->handle_message(c, message);
          },
          [this](const std::string& connection_id){ on_connection_closed(connection_id); },
          logger_,
          outbound_limit_bytes_);
        logger_->info("Accepted connection {} from {}", conn->channel_id(), conn->remote_address());
        std::lock_guard lg(connections_m_);
        connections_[conn->channel_id()] = conn;
      }
      if(started_ && acceptor_ && acceptor_->is_open()) {
        start_accept();
      }
    });
}

void CollabEngine::on_connection_closed(const std::string& connection_id) {
  {
    std::lock_guard lg(connections_m_);
    connections_.erase(connection_id);
  }
  logger_->debug("Connection {} closed", connection_id);
  if(service_) {
    service_->on_disconnected(connection_id);
  }
}

void CollabEngine::schedule_sweep() {
  if(!sweep_timer_) return;
  sweep_timer_->expires_after(std::chrono::milliseconds(sweep_interval_ms_));
  sweep_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    if(registry_) {
      auto ended = registry_->sweep_idle(now_millis());
      if(!ended.empty()) logger_->debug("Idle sweep ended {} sessions", ended.size());
    }
    schedule_sweep();
  });
}

void CollabEngine::run() {
  if(!started_) start();
  for(int i = 1; i < io_thread_count_; ++i) {
    io_threads_.emplace_back([this](){ io_.run(); });
  }
  io_.run();
}

void CollabEngine::start_background() {
  if(!started_) start();
  if(!io_threads_.empty()) return;
  for(int i = 0; i < io_thread_count_; ++i) {
    io_threads_.emplace_back([this](){ io_.run(); });
  }
}

void CollabEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(sweep_timer_) {
    sweep_timer_->cancel();
  }
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }

  std::vector<std::shared_ptr<Connection>> open;
  {
    std::lock_guard lg(connections_m_);
    for(auto& [id, weak] : connections_) {
      if(auto conn = weak.lock()) open.push_back(conn);
    }
  }
  for(auto& conn : open) conn->close();

  io_.stop();
  for(auto& t : io_threads_) {
    if(t.joinable()) t.join();
  }
  io_threads_.clear();
  io_.restart();

  sweep_timer_.reset();
  signals_.reset();
  acceptor_.reset();
  {
    std::lock_guard lg(connections_m_);
    connections_.clear();
  }
  logger_->info("Engine stopped");
}

LogListenerHandle CollabEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void CollabEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void CollabEngine::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}

CollabEngine::Stats CollabEngine::stats() const {
  Stats s;
  {
    std::lock_guard lg(connections_m_);
    for(const auto& [id, weak] : connections_) {
      if(!weak.expired()) ++s.connections;
    }
  }
  if(registry_) {
    s.active_sessions = registry_->active_count();
    for(const auto& session : registry_->sessions()) {
      if(!session->active()) continue;
      s.participants += session->participant_count();
      s.committed_operations += session->head_version();
    }
  }
  return s;
}
