#pragma once

#include <optional>
#include <stdexcept>
#include <string>

// Error taxonomy shared by the registry, the commit pipeline and the wire layer.
enum class ErrorCode {
  SessionClosed,
  CapacityExceeded,
  RoleNotAllowed,
  StaleBaseVersion,
  DanglingReference,
  TargetDeleted,
  Busy,
  NotAMember,
  PermissionDenied,
  UnknownSession,
  InvalidOperation,
  InvalidSettings,
  Unauthenticated,
  UnknownTarget,
  DuplicateTarget
};

const char* to_string(ErrorCode code);

// Rejection reason carried on a rejected Operation ("target-deleted", ...).
const char* rejection_reason(ErrorCode code);
std::optional<ErrorCode> error_code_from_reason(const std::string& reason);

class CollabError : public std::runtime_error {
public:
  CollabError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};
