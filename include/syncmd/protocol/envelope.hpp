#pragma once

#include "syncmd/core/result.hpp"
#include "syncmd/sync/types.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace syncmd::protocol {

using sync::FileRecord;
using sync::SyncOperation;

/// Upper bound for one serialized envelope; larger length prefixes are rejected.
constexpr std::uint32_t kMaxFrameSize = 16 * 1024 * 1024;

struct HandshakeRequest {
    std::string device_id;
    std::string device_name;
    std::string credential_mode;   ///< "token" or "root_digest"
    std::string credential;
};

struct HandshakeResponse {
    bool accepted = false;
    std::string device_id;         ///< Responder's own device id
    std::string identity;          ///< Identity granted to the initiator
    std::string message;
};

struct SyncRequest {
    std::string device_id;
    std::string root_digest;
    std::vector<FileRecord> files;
};

/**
 * @brief Operations the requester must apply, plus files it must send back
 */
struct SyncResponse {
    std::vector<SyncOperation> operations;
    std::vector<std::string> requested_paths;
};

struct FileRequest {
    std::string path;
};

struct FileResponse {
    std::string path;
    bool found = false;
    std::optional<FileRecord> record;
};

struct StartTransfer {
    std::string transfer_id;
    std::string path;
    std::uint64_t size = 0;
    std::uint32_t total_chunks = 0;
    FileRecord record;
};

struct ChunkMessage {
    std::string transfer_id;
    std::uint32_t index = 0;
    std::vector<std::uint8_t> data;
    std::string digest;
};

struct AckChunk {
    std::string transfer_id;
    std::uint32_t index = 0;
};

struct CompleteTransfer {
    std::string transfer_id;
};

struct TransferError {
    std::string transfer_id;
    std::optional<std::uint32_t> index;  ///< Chunk that failed, when one did
    ErrorKind kind = ErrorKind::Io;
    std::string message;
};

struct Heartbeat {
    std::time_t sent_at = 0;
    bool reply = false;  ///< Replies are never answered again
};

using Envelope = std::variant<HandshakeRequest,
                              HandshakeResponse,
                              SyncRequest,
                              SyncResponse,
                              FileRequest,
                              FileResponse,
                              StartTransfer,
                              ChunkMessage,
                              AckChunk,
                              CompleteTransfer,
                              TransferError,
                              Heartbeat>;

/**
 * @brief Wire tag of the envelope variant ("handshake_request", "chunk", ...)
 */
const char* envelope_type(const Envelope& envelope);

/**
 * @brief Serialize @p envelope to its JSON wire form
 *
 * Strings that are not valid UTF-8 cannot be encoded and yield a
 * Serialization error.
 */
Result<std::string> encode_envelope(const Envelope& envelope);
Result<Envelope> decode_envelope(const std::string& payload);

/**
 * @brief Prefix a payload with its 4-byte big-endian length
 */
std::vector<std::uint8_t> frame_payload(const std::string& payload);
std::uint32_t read_frame_length(const std::uint8_t* header);

} // namespace syncmd::protocol
