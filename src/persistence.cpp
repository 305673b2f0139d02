#include "persistence.hpp"

#include <fstream>

#include "protocol.hpp"

JsonlPersistence::JsonlPersistence(asio::io_context& io,
                                   std::filesystem::path data_dir,
                                   std::shared_ptr<Logger> logger)
  : strand_(asio::make_strand(io)),
    data_dir_(std::move(data_dir)),
    logger_(std::move(logger)) {
  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if(ec) {
    log_warn(logger_.get(), "Unable to create data dir {}: {}", data_dir_.string(), ec.message());
  }
}

void JsonlPersistence::store_operation(const Operation& op) {
  auto path = data_dir_ / (op.session_id + ".ops.jsonl");
  auto line = json(op).dump();
  asio::post(strand_, [this, path, line = std::move(line)](){
    append_line(path, line);
  });
}

void JsonlPersistence::store_session(const SessionInfo& session) {
  auto path = data_dir_ / (session.session_id + ".session.json");
  auto content = json(session).dump(2);
  asio::post(strand_, [this, path, content = std::move(content)](){
    replace_file(path, content);
  });
}

void JsonlPersistence::append_line(const std::filesystem::path& path, const std::string& line) {
  std::ofstream out(path, std::ios::app);
  if(!out) {
    ++write_failures_;
    log_error(logger_.get(), "Unable to append to {}", path.string());
    return;
  }
  out << line << '\n';
  ++writes_completed_;
}

void JsonlPersistence::replace_file(const std::filesystem::path& path, const std::string& content) {
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      ++write_failures_;
      log_error(logger_.get(), "Unable to write {}", tmp.string());
      return;
    }
    out << content;
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if(ec) {
    ++write_failures_;
    log_error(logger_.get(), "Unable to replace {}: {}", path.string(), ec.message());
    return;
  }
  ++writes_completed_;
}
