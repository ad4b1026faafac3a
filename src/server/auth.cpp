#include "syncmd/server/auth.hpp"
#include "syncmd/core/config.hpp"
#include "syncmd/core/digest.hpp"

#include <spdlog/spdlog.h>

namespace syncmd::server {

std::string TokenAuthority::issue(const std::string& client_id,
                                  const std::string& client_name,
                                  std::optional<std::chrono::seconds> lifetime) {
    AuthToken token;
    token.token = random_id("syncmd_");
    token.client_id = client_id;
    token.client_name = client_name;
    token.issued_at = Clock::now();
    if (lifetime) {
        token.expires_at = token.issued_at + *lifetime;
    }

    std::lock_guard lock(mutex_);
    tokens_[token.token] = token;
    spdlog::info("Issued token for client {} ({})", client_id, client_name);
    return token.token;
}

Result<AuthToken> TokenAuthority::check(const std::string& token) const {
    std::lock_guard lock(mutex_);
    if (revoked_.count(token) > 0) {
        return Err<AuthToken>(ErrorKind::Auth, "Token revoked");
    }
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return Err<AuthToken>(ErrorKind::Auth, "Invalid authentication token");
    }
    if (it->second.expires_at && Clock::now() >= *it->second.expires_at) {
        return Err<AuthToken>(ErrorKind::Auth, "Token expired");
    }
    return Ok(it->second);
}

bool TokenAuthority::revoke(const std::string& token) {
    std::lock_guard lock(mutex_);
    if (tokens_.erase(token) == 0) {
        return false;
    }
    revoked_.insert(token);
    return true;
}

std::vector<AuthToken> TokenAuthority::list() const {
    std::lock_guard lock(mutex_);
    std::vector<AuthToken> out;
    out.reserve(tokens_.size());
    for (const auto& [_, token] : tokens_) {
        out.push_back(token);
    }
    return out;
}

Result<AuthGrant> TokenAuthority::validate(const protocol::HandshakeRequest& request) const {
    if (request.credential_mode != to_string(CredentialMode::Token)) {
        return Err<AuthGrant>(ErrorKind::Auth, "Unsupported credential mode: " + request.credential_mode);
    }
    auto token = check(request.credential);
    if (token.is_error()) {
        return Err<AuthGrant>(token.error());
    }
    return Ok(AuthGrant{token.value().client_id});
}

RootDigestAuthenticator::RootDigestAuthenticator(std::vector<std::string> allowed_devices)
    : allowed_devices_(allowed_devices.begin(), allowed_devices.end()) {}

Result<AuthGrant> RootDigestAuthenticator::validate(const protocol::HandshakeRequest& request) const {
    if (request.credential_mode != to_string(CredentialMode::RootDigest)) {
        return Err<AuthGrant>(ErrorKind::Auth, "Unsupported credential mode: " + request.credential_mode);
    }
    if (!is_digest_hex(request.credential)) {
        return Err<AuthGrant>(ErrorKind::Auth, "Malformed root digest");
    }
    if (!allowed_devices_.empty() && allowed_devices_.count(request.device_id) == 0) {
        return Err<AuthGrant>(ErrorKind::Auth, "Device not allowed: " + request.device_id);
    }
    return Ok(AuthGrant{request.device_id});
}

} // namespace syncmd::server
