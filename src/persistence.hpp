#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "log.hpp"
#include "operation.hpp"
#include "session_types.hpp"

// Write-through sink for committed operations and session documents. It is
// never consulted for ordering; the operation log is the source of truth.
class PersistenceSink {
public:
  virtual ~PersistenceSink() = default;

  virtual void store_operation(const Operation& op) = 0;
  virtual void store_session(const SessionInfo& session) = 0;
};

class NullPersistence : public PersistenceSink {
public:
  void store_operation(const Operation&) override {}
  void store_session(const SessionInfo&) override {}
};

// <data_dir>/<sessionId>.ops.jsonl gets one line per stored operation (a
// later line for the same id supersedes earlier ones);
// <data_dir>/<sessionId>.session.json is rewritten on every session change.
// Writes are serialized on a strand so callers never wait on the disk.
class JsonlPersistence : public PersistenceSink {
public:
  JsonlPersistence(asio::io_context& io,
                   std::filesystem::path data_dir,
                   std::shared_ptr<Logger> logger = nullptr);

  void store_operation(const Operation& op) override;
  void store_session(const SessionInfo& session) override;

  const std::filesystem::path& data_dir() const { return data_dir_; }
  std::size_t writes_completed() const { return writes_completed_.load(); }
  std::size_t write_failures() const { return write_failures_.load(); }

private:
  void append_line(const std::filesystem::path& path, const std::string& line);
  void replace_file(const std::filesystem::path& path, const std::string& content);

  asio::strand<asio::io_context::executor_type> strand_;
  std::filesystem::path data_dir_;
  std::shared_ptr<Logger> logger_;
  std::atomic<std::size_t> writes_completed_{0};
  std::atomic<std::size_t> write_failures_{0};
};
