#include "syncmd/core/config.hpp"
#include "syncmd/core/digest.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace syncmd {
namespace fs = std::filesystem;
using json = nlohmann::json;

const char* to_string(CredentialMode mode) {
    return mode == CredentialMode::RootDigest ? "root_digest" : "token";
}

Result<NodeConfig> parse_config(const std::string& json_text) {
    NodeConfig config;
    try {
        const json doc = json::parse(json_text);
        if (!doc.is_object()) {
            return Err<NodeConfig>(ErrorKind::Serialization, "Config root must be a JSON object");
        }

        config.device_id = doc.value("device_id", std::string{});
        config.device_name = doc.value("device_name", config.device_name);
        config.sync_root = doc.value("sync_root", std::string{});
        config.listen_address = doc.value("listen_address", config.listen_address);
        config.listen_port = doc.value("listen_port", config.listen_port);
        config.peer_address = doc.value("peer_address", std::string{});
        config.peer_port = doc.value("peer_port", config.peer_port);
        config.auth_token = doc.value("auth_token", std::string{});
        config.periodic_interval = std::chrono::seconds(
            doc.value("periodic_interval_seconds", static_cast<std::int64_t>(config.periodic_interval.count())));
        config.debounce_window = std::chrono::milliseconds(
            doc.value("debounce_ms", static_cast<std::int64_t>(config.debounce_window.count())));
        config.read_timeout = std::chrono::milliseconds(
            doc.value("read_timeout_ms", static_cast<std::int64_t>(config.read_timeout.count())));
        config.discovery_port = doc.value("discovery_port", config.discovery_port);
        config.discovery_timeout = std::chrono::milliseconds(
            doc.value("discovery_timeout_ms", static_cast<std::int64_t>(config.discovery_timeout.count())));
        config.log_level = doc.value("log_level", config.log_level);

        const auto mode = doc.value("credential_mode", std::string("token"));
        if (mode == "token") {
            config.credential_mode = CredentialMode::Token;
        } else if (mode == "root_digest") {
            config.credential_mode = CredentialMode::RootDigest;
        } else {
            return Err<NodeConfig>(ErrorKind::Serialization, "Unknown credential_mode: " + mode);
        }
    } catch (const json::exception& e) {
        return Err<NodeConfig>(ErrorKind::Serialization, std::string("Invalid config: ") + e.what());
    }

    if (config.device_id.empty()) {
        config.device_id = random_id();
        spdlog::info("No device_id configured, generated {}", config.device_id);
    }
    return Ok(std::move(config));
}

Result<NodeConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<NodeConfig>(ErrorKind::Io, "Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

Result<void> save_config(const NodeConfig& config, const fs::path& path) {
    json doc;
    doc["device_id"] = config.device_id;
    doc["device_name"] = config.device_name;
    doc["sync_root"] = config.sync_root.string();
    doc["listen_address"] = config.listen_address;
    doc["listen_port"] = config.listen_port;
    doc["peer_address"] = config.peer_address;
    doc["peer_port"] = config.peer_port;
    doc["credential_mode"] = to_string(config.credential_mode);
    doc["auth_token"] = config.auth_token;
    doc["periodic_interval_seconds"] = config.periodic_interval.count();
    doc["debounce_ms"] = config.debounce_window.count();
    doc["read_timeout_ms"] = config.read_timeout.count();
    doc["discovery_port"] = config.discovery_port;
    doc["discovery_timeout_ms"] = config.discovery_timeout.count();
    doc["log_level"] = config.log_level;

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }
    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorKind::Io, "Failed to write config file: " + path.string());
    }
    output << doc.dump(2);
    return Ok();
}

} // namespace syncmd
