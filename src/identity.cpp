#include "identity.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>

#include "errors.hpp"
#include "utils.hpp"

namespace {

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

} // namespace

VerifiedIdentity TrustingIdentityVerifier::verify(const Participant& claim, const std::string&) const {
  if(claim.user_id.empty()) {
    throw CollabError(ErrorCode::Unauthenticated, "participant has no userId");
  }
  return VerifiedIdentity{claim.user_id, claim.role};
}

bool TokenIdentityVerifier::load_from_file(const std::filesystem::path& path, std::string& error) {
  std::ifstream in(path);
  if(!in) {
    error = "unable to open " + path.string();
    return false;
  }
  std::map<std::string, VerifiedIdentity> loaded;
  try {
    nlohmann::json doc;
    in >> doc;
    for(const auto& entry : doc.at("tokens")) {
      auto digest = lowercase(entry.at("sha256").get<std::string>());
      auto role_name = entry.value("role", std::string("editor"));
      auto role = role_from_string(role_name);
      if(!role) {
        error = "unknown role '" + role_name + "' in " + path.string();
        return false;
      }
      loaded[digest] = VerifiedIdentity{entry.at("user_id").get<std::string>(), *role};
    }
  } catch(const std::exception& e) {
    error = std::string("invalid identity file: ") + e.what();
    return false;
  }
  std::lock_guard lg(m_);
  by_digest_ = std::move(loaded);
  return true;
}

void TokenIdentityVerifier::add_token(const std::string& token, const std::string& user_id, Role role) {
  std::lock_guard lg(m_);
  by_digest_[sha256_hex(token)] = VerifiedIdentity{user_id, role};
}

std::size_t TokenIdentityVerifier::size() const {
  std::lock_guard lg(m_);
  return by_digest_.size();
}

VerifiedIdentity TokenIdentityVerifier::verify(const Participant& claim, const std::string& token) const {
  if(token.empty()) {
    throw CollabError(ErrorCode::Unauthenticated, "missing token");
  }
  VerifiedIdentity found;
  {
    std::lock_guard lg(m_);
    auto it = by_digest_.find(sha256_hex(token));
    if(it == by_digest_.end()) {
      throw CollabError(ErrorCode::Unauthenticated, "unknown token");
    }
    found = it->second;
  }
  if(!claim.user_id.empty() && claim.user_id != found.user_id) {
    throw CollabError(ErrorCode::Unauthenticated,
                      "token belongs to " + found.user_id + ", not " + claim.user_id);
  }
  return found;
}
