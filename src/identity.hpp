#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

#include "session_types.hpp"

struct VerifiedIdentity {
  std::string user_id;
  Role role = Role::Editor;
};

// Turns a participant's claim plus an opaque token into a verified
// user/role pair, or throws CollabError(Unauthenticated).
class IdentityVerifier {
public:
  virtual ~IdentityVerifier() = default;
  virtual VerifiedIdentity verify(const Participant& claim, const std::string& token) const = 0;
};

// Accepts the claim as-is. Used when no identity file is configured.
class TrustingIdentityVerifier : public IdentityVerifier {
public:
  VerifiedIdentity verify(const Participant& claim, const std::string& token) const override;
};

// Tokens are stored as SHA-256 hex digests:
//   {"tokens":[{"sha256":"<hex>","user_id":"alice","role":"owner"}]}
class TokenIdentityVerifier : public IdentityVerifier {
public:
  bool load_from_file(const std::filesystem::path& path, std::string& error);
  void add_token(const std::string& token, const std::string& user_id, Role role);
  std::size_t size() const;

  VerifiedIdentity verify(const Participant& claim, const std::string& token) const override;

private:
  mutable std::mutex m_;
  std::map<std::string, VerifiedIdentity> by_digest_;
};
