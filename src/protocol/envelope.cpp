#include "syncmd/protocol/envelope.hpp"
#include "syncmd/core/digest.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace syncmd::protocol {
namespace {

using json = nlohmann::json;

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

json record_to_json(const FileRecord& record) {
    json j;
    j["path"] = record.path;
    j["digest"] = record.digest;
    j["size"] = record.size;
    j["modified_time"] = record.modified_time;
    j["created_time"] = record.created_time;
    j["version"] = record.version;
    j["device_id"] = record.device_id;
    return j;
}

FileRecord record_from_json(const json& j) {
    FileRecord record;
    record.path = j.at("path").get<std::string>();
    record.digest = j.at("digest").get<std::string>();
    record.size = j.at("size").get<std::uint64_t>();
    record.modified_time = j.at("modified_time").get<std::time_t>();
    record.created_time = j.value("created_time", record.modified_time);
    record.version = j.value("version", static_cast<std::uint64_t>(0));
    record.device_id = j.value("device_id", std::string{});
    return record;
}

json records_to_json(const std::vector<FileRecord>& records) {
    json arr = json::array();
    for (const auto& record : records) {
        arr.push_back(record_to_json(record));
    }
    return arr;
}

std::vector<FileRecord> records_from_json(const json& arr) {
    std::vector<FileRecord> records;
    for (const auto& entry : arr) {
        records.push_back(record_from_json(entry));
    }
    return records;
}

json operation_to_json(const SyncOperation& op) {
    json j;
    j["op"] = sync::operation_name(op);
    if (const auto* record = sync::operation_record(op)) {
        j["record"] = record_to_json(*record);
    } else {
        j["path"] = std::get<sync::DeleteOp>(op).path;
    }
    return j;
}

std::optional<SyncOperation> operation_from_json(const json& j) {
    const auto op = j.at("op").get<std::string>();
    if (op == "add") {
        return SyncOperation{sync::AddOp{record_from_json(j.at("record"))}};
    }
    if (op == "update") {
        return SyncOperation{sync::UpdateOp{record_from_json(j.at("record"))}};
    }
    if (op == "delete") {
        return SyncOperation{sync::DeleteOp{j.at("path").get<std::string>()}};
    }
    return std::nullopt;
}

} // namespace

const char* envelope_type(const Envelope& envelope) {
    return std::visit(overloaded{
        [](const HandshakeRequest&) { return "handshake_request"; },
        [](const HandshakeResponse&) { return "handshake_response"; },
        [](const SyncRequest&) { return "sync_request"; },
        [](const SyncResponse&) { return "sync_response"; },
        [](const FileRequest&) { return "file_request"; },
        [](const FileResponse&) { return "file_response"; },
        [](const StartTransfer&) { return "start_transfer"; },
        [](const ChunkMessage&) { return "chunk"; },
        [](const AckChunk&) { return "ack_chunk"; },
        [](const CompleteTransfer&) { return "complete_transfer"; },
        [](const TransferError&) { return "transfer_error"; },
        [](const Heartbeat&) { return "heartbeat"; },
    }, envelope);
}

Result<std::string> encode_envelope(const Envelope& envelope) {
    json j;
    j["type"] = envelope_type(envelope);

    std::visit(overloaded{
        [&](const HandshakeRequest& m) {
            j["device_id"] = m.device_id;
            j["device_name"] = m.device_name;
            j["credential_mode"] = m.credential_mode;
            j["credential"] = m.credential;
        },
        [&](const HandshakeResponse& m) {
            j["accepted"] = m.accepted;
            j["device_id"] = m.device_id;
            j["identity"] = m.identity;
            j["message"] = m.message;
        },
        [&](const SyncRequest& m) {
            j["device_id"] = m.device_id;
            j["root_digest"] = m.root_digest;
            j["files"] = records_to_json(m.files);
        },
        [&](const SyncResponse& m) {
            json ops = json::array();
            for (const auto& op : m.operations) {
                ops.push_back(operation_to_json(op));
            }
            j["operations"] = std::move(ops);
            j["requested_paths"] = m.requested_paths;
        },
        [&](const FileRequest& m) {
            j["path"] = m.path;
        },
        [&](const FileResponse& m) {
            j["path"] = m.path;
            j["found"] = m.found;
            if (m.record) {
                j["record"] = record_to_json(*m.record);
            }
        },
        [&](const StartTransfer& m) {
            j["transfer_id"] = m.transfer_id;
            j["path"] = m.path;
            j["size"] = m.size;
            j["total_chunks"] = m.total_chunks;
            j["record"] = record_to_json(m.record);
        },
        [&](const ChunkMessage& m) {
            j["transfer_id"] = m.transfer_id;
            j["index"] = m.index;
            j["data"] = hex_encode(m.data);
            j["digest"] = m.digest;
        },
        [&](const AckChunk& m) {
            j["transfer_id"] = m.transfer_id;
            j["index"] = m.index;
        },
        [&](const CompleteTransfer& m) {
            j["transfer_id"] = m.transfer_id;
        },
        [&](const TransferError& m) {
            j["transfer_id"] = m.transfer_id;
            if (m.index) {
                j["index"] = *m.index;
            }
            j["kind"] = to_string(m.kind);
            j["message"] = m.message;
        },
        [&](const Heartbeat& m) {
            j["sent_at"] = m.sent_at;
            j["reply"] = m.reply;
        },
    }, envelope);

    try {
        return Ok(j.dump());
    } catch (const json::exception& e) {
        return Err<std::string>(ErrorKind::Serialization,
                                std::string("Cannot encode ") + envelope_type(envelope) + ": " + e.what());
    }
}

Result<Envelope> decode_envelope(const std::string& payload) {
    try {
        const json j = json::parse(payload);
        const auto type = j.at("type").get<std::string>();

        if (type == "handshake_request") {
            HandshakeRequest m;
            m.device_id = j.at("device_id").get<std::string>();
            m.device_name = j.value("device_name", std::string{});
            m.credential_mode = j.at("credential_mode").get<std::string>();
            m.credential = j.at("credential").get<std::string>();
            return Ok<Envelope>(std::move(m));
        }
        if (type == "handshake_response") {
            HandshakeResponse m;
            m.accepted = j.at("accepted").get<bool>();
            m.device_id = j.value("device_id", std::string{});
            m.identity = j.value("identity", std::string{});
            m.message = j.value("message", std::string{});
            return Ok<Envelope>(std::move(m));
        }
        if (type == "sync_request") {
            SyncRequest m;
            m.device_id = j.at("device_id").get<std::string>();
            m.root_digest = j.value("root_digest", std::string{});
            m.files = records_from_json(j.at("files"));
            return Ok<Envelope>(std::move(m));
        }
        if (type == "sync_response") {
            SyncResponse m;
            for (const auto& entry : j.at("operations")) {
                auto op = operation_from_json(entry);
                if (!op) {
                    return Err<Envelope>(ErrorKind::Serialization, "Unknown sync operation in response");
                }
                m.operations.push_back(std::move(*op));
            }
            m.requested_paths = j.value("requested_paths", std::vector<std::string>{});
            return Ok<Envelope>(std::move(m));
        }
        if (type == "file_request") {
            return Ok<Envelope>(FileRequest{j.at("path").get<std::string>()});
        }
        if (type == "file_response") {
            FileResponse m;
            m.path = j.at("path").get<std::string>();
            m.found = j.at("found").get<bool>();
            if (j.contains("record")) {
                m.record = record_from_json(j.at("record"));
            }
            return Ok<Envelope>(std::move(m));
        }
        if (type == "start_transfer") {
            StartTransfer m;
            m.transfer_id = j.at("transfer_id").get<std::string>();
            m.path = j.at("path").get<std::string>();
            m.size = j.at("size").get<std::uint64_t>();
            m.total_chunks = j.at("total_chunks").get<std::uint32_t>();
            m.record = record_from_json(j.at("record"));
            return Ok<Envelope>(std::move(m));
        }
        if (type == "chunk") {
            ChunkMessage m;
            m.transfer_id = j.at("transfer_id").get<std::string>();
            m.index = j.at("index").get<std::uint32_t>();
            auto data = hex_decode(j.at("data").get<std::string>());
            if (data.is_error()) {
                return Err<Envelope>(data.error());
            }
            m.data = std::move(data.value());
            m.digest = j.at("digest").get<std::string>();
            return Ok<Envelope>(std::move(m));
        }
        if (type == "ack_chunk") {
            return Ok<Envelope>(AckChunk{j.at("transfer_id").get<std::string>(),
                                         j.at("index").get<std::uint32_t>()});
        }
        if (type == "complete_transfer") {
            return Ok<Envelope>(CompleteTransfer{j.at("transfer_id").get<std::string>()});
        }
        if (type == "transfer_error") {
            TransferError m;
            m.transfer_id = j.at("transfer_id").get<std::string>();
            if (j.contains("index")) {
                m.index = j.at("index").get<std::uint32_t>();
            }
            m.kind = error_kind_from_string(j.value("kind", std::string("io")));
            m.message = j.value("message", std::string{});
            return Ok<Envelope>(std::move(m));
        }
        if (type == "heartbeat") {
            return Ok<Envelope>(Heartbeat{j.value("sent_at", static_cast<std::time_t>(0)),
                                          j.value("reply", false)});
        }

        return Err<Envelope>(ErrorKind::Serialization, "Unknown envelope type: " + type);
    } catch (const json::exception& e) {
        return Err<Envelope>(ErrorKind::Serialization, std::string("Malformed envelope: ") + e.what());
    }
}

std::vector<std::uint8_t> frame_payload(const std::string& payload) {
    const auto length = static_cast<std::uint32_t>(payload.size());
    std::vector<std::uint8_t> frame;
    frame.reserve(4 + payload.size());
    frame.push_back(static_cast<std::uint8_t>((length >> 24) & 0xFF));
    frame.push_back(static_cast<std::uint8_t>((length >> 16) & 0xFF));
    frame.push_back(static_cast<std::uint8_t>((length >> 8) & 0xFF));
    frame.push_back(static_cast<std::uint8_t>(length & 0xFF));
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::uint32_t read_frame_length(const std::uint8_t* header) {
    return (static_cast<std::uint32_t>(header[0]) << 24) |
           (static_cast<std::uint32_t>(header[1]) << 16) |
           (static_cast<std::uint32_t>(header[2]) << 8) |
           static_cast<std::uint32_t>(header[3]);
}

} // namespace syncmd::protocol
