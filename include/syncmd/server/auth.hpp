#pragma once

#include "syncmd/core/result.hpp"
#include "syncmd/protocol/envelope.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace syncmd::server {

/**
 * @brief Outcome of a successful handshake validation
 */
struct AuthGrant {
    std::string identity;
};

/**
 * @brief Opaque accept/reject for a handshake credential
 *
 * Implementations must be safe to call from several connection threads.
 */
class Authenticator {
public:
    virtual ~Authenticator() = default;

    /// Rejections are ErrorKind::Auth.
    virtual Result<AuthGrant> validate(const protocol::HandshakeRequest& request) const = 0;
};

struct AuthToken {
    std::string token;
    std::string client_id;
    std::string client_name;
    std::chrono::system_clock::time_point issued_at{};
    std::optional<std::chrono::system_clock::time_point> expires_at;
};

/**
 * @brief Issues and validates bearer tokens ("syncmd_<uuid>")
 *
 * A validated token grants the identity of the client it was issued to.
 */
class TokenAuthority : public Authenticator {
public:
    using Clock = std::chrono::system_clock;

    std::string issue(const std::string& client_id,
                      const std::string& client_name,
                      std::optional<std::chrono::seconds> lifetime = std::nullopt);

    [[nodiscard]] Result<AuthToken> check(const std::string& token) const;

    /// False when the token was never issued or is already revoked.
    bool revoke(const std::string& token);

    [[nodiscard]] std::vector<AuthToken> list() const;

    Result<AuthGrant> validate(const protocol::HandshakeRequest& request) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, AuthToken> tokens_;
    std::unordered_set<std::string> revoked_;
};

/**
 * @brief Accepts root_digest handshakes carrying a well-formed SHA-256 hex digest
 *
 * An empty allow-list admits every device id.
 */
class RootDigestAuthenticator : public Authenticator {
public:
    explicit RootDigestAuthenticator(std::vector<std::string> allowed_devices = {});

    Result<AuthGrant> validate(const protocol::HandshakeRequest& request) const override;

private:
    std::unordered_set<std::string> allowed_devices_;
};

} // namespace syncmd::server
