#include "errors.hpp"

#include <array>

namespace {

struct ErrorNames {
  ErrorCode code;
  const char* name;
  const char* reason;
};

constexpr std::array<ErrorNames, 15> kErrorNames = {{
  {ErrorCode::SessionClosed,     "SessionClosed",     "session-closed"},
  {ErrorCode::CapacityExceeded,  "CapacityExceeded",  "capacity-exceeded"},
  {ErrorCode::RoleNotAllowed,    "RoleNotAllowed",    "role-not-allowed"},
  {ErrorCode::StaleBaseVersion,  "StaleBaseVersion",  "stale-base-version"},
  {ErrorCode::DanglingReference, "DanglingReference", "dangling-reference"},
  {ErrorCode::TargetDeleted,     "TargetDeleted",     "target-deleted"},
  {ErrorCode::Busy,              "Busy",              "busy"},
  {ErrorCode::NotAMember,        "NotAMember",        "not-a-member"},
  {ErrorCode::PermissionDenied,  "PermissionDenied",  "permission-denied"},
  {ErrorCode::UnknownSession,    "UnknownSession",    "unknown-session"},
  {ErrorCode::InvalidOperation,  "InvalidOperation",  "invalid-operation"},
  {ErrorCode::InvalidSettings,   "InvalidSettings",   "invalid-settings"},
  {ErrorCode::Unauthenticated,   "Unauthenticated",   "unauthenticated"},
  {ErrorCode::UnknownTarget,     "UnknownTarget",     "unknown-target"},
  {ErrorCode::DuplicateTarget,   "DuplicateTarget",   "duplicate-target"}
}};

const ErrorNames* find_names(ErrorCode code) {
  for(const auto& entry : kErrorNames) {
    if(entry.code == code) return &entry;
  }
  return nullptr;
}

} // namespace

const char* to_string(ErrorCode code) {
  const auto* names = find_names(code);
  return names ? names->name : "Unknown";
}

const char* rejection_reason(ErrorCode code) {
  const auto* names = find_names(code);
  return names ? names->reason : "unknown";
}

std::optional<ErrorCode> error_code_from_reason(const std::string& reason) {
  for(const auto& entry : kErrorNames) {
    if(reason == entry.reason) return entry.code;
  }
  return std::nullopt;
}
