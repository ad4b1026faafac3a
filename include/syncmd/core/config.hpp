#pragma once

#include "syncmd/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace syncmd {

enum class CredentialMode {
    Token,      ///< Bearer token included verbatim in the handshake
    RootDigest  ///< Declared root-content digest of the local snapshot
};

const char* to_string(CredentialMode mode);

/**
 * @brief Runtime settings for one sync node (server or client role)
 *
 * Loaded from a JSON document; every key is optional and falls back to the
 * defaults below.
 */
struct NodeConfig {
    std::string device_id;
    std::string device_name = "syncmd-node";
    std::filesystem::path sync_root;

    std::string listen_address = "0.0.0.0";
    std::uint16_t listen_port = 8080;

    std::string peer_address;
    std::uint16_t peer_port = 8080;

    CredentialMode credential_mode = CredentialMode::Token;
    std::string auth_token;

    std::chrono::seconds periodic_interval{30};
    std::chrono::milliseconds debounce_window{500};
    /// Zero disables the timeout on protocol reads (acknowledge and response waits).
    std::chrono::milliseconds read_timeout{0};

    std::uint16_t discovery_port = 8081;
    std::chrono::milliseconds discovery_timeout{2000};

    std::string log_level = "info";
};

Result<NodeConfig> parse_config(const std::string& json_text);
Result<NodeConfig> load_config(const std::filesystem::path& path);
Result<void> save_config(const NodeConfig& config, const std::filesystem::path& path);

} // namespace syncmd
