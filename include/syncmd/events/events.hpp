#pragma once

#include "syncmd/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace syncmd::events {

struct TransferStartedEvent {
    std::string transfer_id;
    std::string path;
    std::uint64_t size = 0;
    std::uint32_t total_chunks = 0;
};

/**
 * @brief Advisory progress: chunks_received * chunk_size / size, capped at 1
 */
struct TransferProgressEvent {
    std::string transfer_id;
    std::string path;
    std::uint32_t chunks_received = 0;
    std::uint32_t total_chunks = 0;
    double progress = 0.0;
};

struct TransferCommittedEvent {
    std::string transfer_id;
    std::string path;
    std::uint64_t size = 0;
    std::chrono::milliseconds duration{0};
};

struct TransferFailedEvent {
    std::string transfer_id;
    std::string path;
    ErrorKind kind = ErrorKind::Io;
    std::string message;
};

struct PeerAuthenticatedEvent {
    std::string device_id;
    std::string identity;
    std::string address;
};

struct SyncCompletedEvent {
    std::string peer_device_id;
    std::size_t operations_applied = 0;  ///< Operations applied on this side
    std::size_t files_sent = 0;
    std::chrono::milliseconds duration{0};
};

} // namespace syncmd::events
