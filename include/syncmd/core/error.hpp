#pragma once

#include <string>

namespace syncmd {

enum class ErrorKind {
    Io,                 ///< Filesystem access failure
    Serialization,      ///< Malformed envelope or config document
    Network,            ///< Connection-level failure, including peer rejection
    PathResolution,     ///< Path cannot be expressed relative to a sync root
    Checksum,           ///< Chunk integrity mismatch
    IncompleteTransfer, ///< Commit attempted before all chunks arrived
    Auth,               ///< Credential rejected, expired or revoked
    Protocol            ///< Envelope not valid for the current session state
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io: return "io";
        case ErrorKind::Serialization: return "serialization";
        case ErrorKind::Network: return "network";
        case ErrorKind::PathResolution: return "path_resolution";
        case ErrorKind::Checksum: return "checksum";
        case ErrorKind::IncompleteTransfer: return "incomplete_transfer";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Protocol: return "protocol";
    }
    return "unknown";
}

inline ErrorKind error_kind_from_string(const std::string& name) {
    if (name == "serialization") return ErrorKind::Serialization;
    if (name == "network") return ErrorKind::Network;
    if (name == "path_resolution") return ErrorKind::PathResolution;
    if (name == "checksum") return ErrorKind::Checksum;
    if (name == "incomplete_transfer") return ErrorKind::IncompleteTransfer;
    if (name == "auth") return ErrorKind::Auth;
    if (name == "protocol") return ErrorKind::Protocol;
    return ErrorKind::Io;
}

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

} // namespace syncmd
