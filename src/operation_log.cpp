#include "operation_log.hpp"

#include "errors.hpp"

OperationLog::OperationLog(std::string session_id, uint64_t retained_window)
  : session_id_(std::move(session_id)),
    retained_window_(retained_window == 0 ? 1 : retained_window) {}

uint64_t OperationLog::append(Operation& op) {
  return append(op, op.payload);
}

uint64_t OperationLog::append(Operation& op, const OperationPayload& submitted) {
  std::lock_guard lg(m_);
  if(closed_) {
    throw CollabError(ErrorCode::SessionClosed, "session " + session_id_ + " has ended");
  }
  if(op.status == OperationStatus::Rejected || op.status == OperationStatus::Pending) {
    throw CollabError(ErrorCode::InvalidOperation,
                      "operation " + op.id + " is " + to_string(op.status) + " and cannot be committed");
  }
  if(committed_by_id_.count(op.id)) {
    throw CollabError(ErrorCode::InvalidOperation, "operation " + op.id + " already committed");
  }
  op.session_id = session_id_;
  op.committed_version = static_cast<uint64_t>(committed_.size()) + 1;
  committed_by_id_[op.id] = committed_.size();
  arrival_.push_back(ArrivalSlot{true, committed_.size()});
  committed_.push_back(LogEntry{op, submitted});
  return op.committed_version;
}

void OperationLog::record_rejected(const Operation& op) {
  std::lock_guard lg(m_);
  Operation copy = op;
  copy.session_id = session_id_;
  copy.status = OperationStatus::Rejected;
  copy.committed_version = 0;
  arrival_.push_back(ArrivalSlot{false, rejected_.size()});
  rejected_.push_back(std::move(copy));
}

std::vector<Operation> OperationLog::range(uint64_t from_version, uint64_t to_version) const {
  std::lock_guard lg(m_);
  std::vector<Operation> out;
  const uint64_t head = committed_.size();
  if(from_version == 0) from_version = 1;
  if(to_version == 0 || to_version > head) to_version = head;
  for(uint64_t v = from_version; v <= to_version; ++v) {
    out.push_back(committed_[v - 1].operation);
  }
  return out;
}

std::vector<Operation> OperationLog::by_target(TargetKind kind, const std::string& target_id) const {
  std::lock_guard lg(m_);
  std::vector<Operation> out;
  for(const auto& entry : committed_) {
    if(entry.operation.target.kind == kind && entry.operation.target.id == target_id) {
      out.push_back(entry.operation);
    }
  }
  return out;
}

std::vector<LogEntry> OperationLog::window_after(uint64_t base_version) const {
  std::lock_guard lg(m_);
  std::vector<LogEntry> out;
  for(std::size_t i = base_version; i < committed_.size(); ++i) {
    out.push_back(committed_[i]);
  }
  return out;
}

std::vector<std::string> OperationLog::edge_endpoints(const std::string& edge_id) const {
  std::lock_guard lg(m_);
  std::string source;
  std::string target;
  for(const auto& entry : committed_) {
    const auto& op = entry.operation;
    if(op.target.kind != TargetKind::Edge || op.target.id != edge_id) continue;
    if(op.status == OperationStatus::Rejected) continue;
    if(const auto* add = op.payload_as<EdgeAddPayload>()) {
      source = add->edge.source;
      target = add->edge.target;
    } else if(const auto* update = op.payload_as<EdgeUpdatePayload>()) {
      if(update->source) source = *update->source;
      if(update->target) target = *update->target;
    }
  }
  std::vector<std::string> out;
  if(!source.empty()) out.push_back(source);
  if(!target.empty()) out.push_back(target);
  return out;
}

void OperationLog::check_base_version(uint64_t base_version) const {
  std::lock_guard lg(m_);
  const uint64_t head = committed_.size();
  if(base_version > head) {
    throw CollabError(ErrorCode::InvalidOperation,
                      "base version " + std::to_string(base_version) +
                      " is ahead of head " + std::to_string(head));
  }
  if(head - base_version > retained_window_) {
    throw CollabError(ErrorCode::StaleBaseVersion,
                      "base version " + std::to_string(base_version) +
                      " is older than the retained window (head " + std::to_string(head) + ")");
  }
}

std::optional<Operation> OperationLog::mark(const std::string& operation_id,
                                            OperationStatus status,
                                            const std::string& reason,
                                            const std::string& related_id) {
  std::lock_guard lg(m_);
  auto it = committed_by_id_.find(operation_id);
  if(it == committed_by_id_.end()) return std::nullopt;
  auto& op = committed_[it->second].operation;
  op.status = status;
  op.reason = reason;
  if(status == OperationStatus::Transformed) {
    op.winner_id = related_id;
  } else if(status == OperationStatus::Rejected) {
    op.conflicting_id = related_id;
  }
  return op;
}

std::optional<Operation> OperationLog::find(const std::string& operation_id) const {
  std::lock_guard lg(m_);
  auto it = committed_by_id_.find(operation_id);
  if(it != committed_by_id_.end()) return committed_[it->second].operation;
  for(const auto& op : rejected_) {
    if(op.id == operation_id) return op;
  }
  return std::nullopt;
}

bool OperationLog::contains(const std::string& operation_id) const {
  return find(operation_id).has_value();
}

bool OperationLog::has_committed(const Target& target, OperationType type) const {
  std::lock_guard lg(m_);
  for(const auto& entry : committed_) {
    if(entry.operation.type == type && entry.operation.target == target) return true;
  }
  return false;
}

std::vector<Operation> OperationLog::audit() const {
  std::lock_guard lg(m_);
  std::vector<Operation> out;
  out.reserve(arrival_.size());
  for(const auto& slot : arrival_) {
    out.push_back(slot.committed ? committed_[slot.index].operation : rejected_[slot.index]);
  }
  return out;
}

uint64_t OperationLog::head() const {
  std::lock_guard lg(m_);
  return committed_.size();
}

std::size_t OperationLog::committed_count() const {
  std::lock_guard lg(m_);
  return committed_.size();
}

std::size_t OperationLog::rejected_count() const {
  std::lock_guard lg(m_);
  std::size_t count = rejected_.size();
  for(const auto& entry : committed_) {
    if(entry.operation.status == OperationStatus::Rejected) ++count;
  }
  return count;
}

void OperationLog::close() {
  std::lock_guard lg(m_);
  closed_ = true;
}

bool OperationLog::closed() const {
  std::lock_guard lg(m_);
  return closed_;
}
