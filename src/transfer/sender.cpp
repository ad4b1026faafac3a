#include "syncmd/transfer/transfer.hpp"
#include "syncmd/core/digest.hpp"
#include "syncmd/events/events.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <system_error>
#include <vector>

namespace syncmd::transfer {
namespace fs = std::filesystem;

std::uint32_t chunk_count(std::uint64_t size, std::size_t chunk_size) {
    return static_cast<std::uint32_t>((size + chunk_size - 1) / chunk_size);
}

double transfer_progress(std::uint32_t chunks_received, std::uint64_t size, std::size_t chunk_size) {
    if (size == 0) {
        return 1.0;
    }
    const double ratio = static_cast<double>(chunks_received) * static_cast<double>(chunk_size) /
                         static_cast<double>(size);
    return ratio > 1.0 ? 1.0 : ratio;
}

fs::path staging_path_for(const fs::path& final_path) {
    return fs::path(final_path.string() + ".tmp");
}

const char* to_string(SenderState state) {
    switch (state) {
        case SenderState::Idle: return "idle";
        case SenderState::HeaderSent: return "header_sent";
        case SenderState::ChunkSent: return "chunk_sent";
        case SenderState::AckAwaited: return "ack_awaited";
        case SenderState::CompleteSent: return "complete_sent";
        case SenderState::Failed: return "failed";
    }
    return "unknown";
}

TransferSender::TransferSender(protocol::EnvelopeChannel& channel,
                               events::EventBus* bus,
                               std::size_t chunk_size)
    : channel_(channel), bus_(bus), chunk_size_(chunk_size == 0 ? kChunkSize : chunk_size) {}

Result<std::string> TransferSender::fail(Error error) {
    state_ = SenderState::Failed;
    spdlog::warn("Transfer send failed: {}", error.describe());
    return Err<std::string>(std::move(error));
}

Result<std::string> TransferSender::send_file(const fs::path& source, const sync::FileRecord& record) {
    state_ = SenderState::Idle;

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return fail(Error{ErrorKind::Io, "Failed to open source file: " + source.string()});
    }

    std::error_code ec;
    const auto file_size = fs::file_size(source, ec);
    if (ec) {
        return fail(Error{ErrorKind::Io, "Failed to stat source file: " + source.string()});
    }

    protocol::StartTransfer start;
    start.transfer_id = random_id();
    start.path = record.path;
    start.size = file_size;
    start.total_chunks = chunk_count(file_size, chunk_size_);
    start.record = record;

    spdlog::info("Sending {} ({} bytes, {} chunks, transfer {})",
                 record.path, file_size, start.total_chunks, start.transfer_id);

    if (auto res = channel_.send(start); res.is_error()) {
        return fail(res.error());
    }
    state_ = SenderState::HeaderSent;

    std::vector<std::uint8_t> buffer(chunk_size_);
    std::uint32_t index = 0;
    while (index < start.total_chunks) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk_size_));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            break;
        }

        protocol::ChunkMessage chunk;
        chunk.transfer_id = start.transfer_id;
        chunk.index = index;
        chunk.data.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(bytes_read));
        chunk.digest = sha256_hex(chunk.data);
        if (chunk_hook_) {
            chunk_hook_(chunk);
        }

        if (auto res = channel_.send(chunk); res.is_error()) {
            return fail(res.error());
        }
        state_ = SenderState::ChunkSent;

        if (auto res = await_ack(start.transfer_id, index); res.is_error()) {
            if (bus_) {
                bus_->emit(events::TransferFailedEvent{start.transfer_id, record.path,
                                                       res.error().kind, res.error().message});
            }
            return fail(res.error());
        }
        ++index;
    }

    if (index != start.total_chunks) {
        // Source shrank after the header went out; the receiver will refuse the commit.
        spdlog::warn("Source {} ended after {} of {} chunks", source.string(), index, start.total_chunks);
    }

    if (auto res = channel_.send(protocol::CompleteTransfer{start.transfer_id}); res.is_error()) {
        return fail(res.error());
    }
    state_ = SenderState::CompleteSent;
    spdlog::debug("Transfer {} complete ({} chunks sent)", start.transfer_id, index);
    return Ok(start.transfer_id);
}

Result<void> TransferSender::await_ack(const std::string& transfer_id, std::uint32_t index) {
    state_ = SenderState::AckAwaited;
    while (true) {
        auto envelope = channel_.receive();
        if (envelope.is_error()) {
            return Err<void>(envelope.error());
        }

        if (const auto* ack = std::get_if<protocol::AckChunk>(&envelope.value())) {
            if (ack->transfer_id == transfer_id && ack->index == index) {
                return Ok();
            }
            return Err<void>(ErrorKind::Protocol, "Unexpected acknowledge for " + ack->transfer_id +
                                                      "#" + std::to_string(ack->index) + ", awaiting " +
                                                      transfer_id + "#" + std::to_string(index));
        }

        if (const auto* error = std::get_if<protocol::TransferError>(&envelope.value())) {
            return Err<void>(error->kind, "Peer aborted transfer " + error->transfer_id + ": " + error->message);
        }

        if (const auto* heartbeat = std::get_if<protocol::Heartbeat>(&envelope.value())) {
            if (!heartbeat->reply) {
                if (auto res = channel_.send(protocol::Heartbeat{std::time(nullptr), true}); res.is_error()) {
                    return res;
                }
            }
            continue;
        }

        return Err<void>(ErrorKind::Protocol, std::string("Unexpected ") + protocol::envelope_type(envelope.value()) +
                                                  " while awaiting chunk acknowledge");
    }
}

} // namespace syncmd::transfer
