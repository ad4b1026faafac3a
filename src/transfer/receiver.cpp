#include "syncmd/transfer/transfer.hpp"
#include "syncmd/core/digest.hpp"
#include "syncmd/events/events.hpp"
#include "syncmd/sync/indexer.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <system_error>

namespace syncmd::transfer {
namespace fs = std::filesystem;

Result<void> TransferRegistry::insert(std::shared_ptr<ActiveTransfer> transfer) {
    std::lock_guard lock(mutex_);
    const auto id = transfer->transfer_id;
    if (!transfers_.emplace(id, std::move(transfer)).second) {
        return Err<void>(ErrorKind::Protocol, "Transfer already in flight: " + id);
    }
    return Ok();
}

std::shared_ptr<ActiveTransfer> TransferRegistry::find(const std::string& transfer_id) const {
    std::lock_guard lock(mutex_);
    const auto it = transfers_.find(transfer_id);
    return it == transfers_.end() ? nullptr : it->second;
}

std::shared_ptr<ActiveTransfer> TransferRegistry::take(const std::string& transfer_id) {
    std::lock_guard lock(mutex_);
    const auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return nullptr;
    }
    auto transfer = std::move(it->second);
    transfers_.erase(it);
    return transfer;
}

bool TransferRegistry::contains(const std::string& transfer_id) const {
    std::lock_guard lock(mutex_);
    return transfers_.count(transfer_id) > 0;
}

std::size_t TransferRegistry::size() const {
    std::lock_guard lock(mutex_);
    return transfers_.size();
}

TransferReceiver::TransferReceiver(fs::path root, TransferRegistry& registry, events::EventBus* bus)
    : root_(std::move(root)), registry_(registry), bus_(bus) {}

Result<fs::path> TransferReceiver::resolve(const std::string& relative_path) const {
    return sync::SnapshotIndexer("", root_).resolve(relative_path);
}

void TransferReceiver::report_failure(const ActiveTransfer& transfer, const Error& error) {
    spdlog::warn("Transfer {} for {} aborted: {}", transfer.transfer_id, transfer.relative_path, error.describe());
    if (bus_) {
        bus_->emit(events::TransferFailedEvent{transfer.transfer_id, transfer.relative_path,
                                               error.kind, error.message});
    }
}

Result<void> TransferReceiver::begin(const protocol::StartTransfer& start) {
    if (registry_.contains(start.transfer_id)) {
        return Err<void>(ErrorKind::Protocol, "Transfer already in flight: " + start.transfer_id);
    }

    auto final_path = resolve(start.path);
    if (final_path.is_error()) {
        return Err<void>(final_path.error());
    }

    std::error_code ec;
    fs::create_directories(final_path.value().parent_path(), ec);
    if (ec) {
        return Err<void>(ErrorKind::Io, "Failed to create directories for " + start.path + ": " + ec.message());
    }

    auto transfer = std::make_shared<ActiveTransfer>();
    transfer->transfer_id = start.transfer_id;
    transfer->relative_path = start.path;
    transfer->final_path = final_path.value();
    transfer->staging_path = staging_path_for(final_path.value());
    transfer->size = start.size;
    transfer->total_chunks = start.total_chunks;
    transfer->record = start.record;
    transfer->started_at = std::chrono::steady_clock::now();
    transfer->staging.open(transfer->staging_path, std::ios::binary | std::ios::trunc);
    if (!transfer->staging) {
        return Err<void>(ErrorKind::Io, "Failed to open staging file: " + transfer->staging_path.string());
    }

    if (auto res = registry_.insert(transfer); res.is_error()) {
        return res;
    }

    spdlog::info("Receiving {} ({} bytes, {} chunks, transfer {})",
                 start.path, start.size, start.total_chunks, start.transfer_id);
    if (bus_) {
        bus_->emit(events::TransferStartedEvent{start.transfer_id, start.path, start.size, start.total_chunks});
    }
    return Ok();
}

Result<protocol::AckChunk> TransferReceiver::accept_chunk(const protocol::ChunkMessage& chunk) {
    auto transfer = registry_.find(chunk.transfer_id);
    if (!transfer) {
        return Err<protocol::AckChunk>(ErrorKind::Protocol, "Unknown transfer: " + chunk.transfer_id);
    }

    std::uint32_t received = 0;
    {
        std::lock_guard lock(transfer->mutex);

        if (sha256_hex(chunk.data) != chunk.digest) {
            Error error{ErrorKind::Checksum, "Checksum mismatch for chunk " + std::to_string(chunk.index)};
            transfer->staging.close();
            registry_.take(chunk.transfer_id);
            report_failure(*transfer, error);
            return Err<protocol::AckChunk>(std::move(error));
        }

        if (chunk.index != transfer->chunks_received || chunk.index >= transfer->total_chunks) {
            Error error{ErrorKind::Protocol, "Out-of-order chunk " + std::to_string(chunk.index) +
                                                 ", expected " + std::to_string(transfer->chunks_received)};
            transfer->staging.close();
            registry_.take(chunk.transfer_id);
            report_failure(*transfer, error);
            return Err<protocol::AckChunk>(std::move(error));
        }

        transfer->staging.write(reinterpret_cast<const char*>(chunk.data.data()),
                                static_cast<std::streamsize>(chunk.data.size()));
        if (!transfer->staging) {
            Error error{ErrorKind::Io, "Failed to write chunk " + std::to_string(chunk.index) + " to " +
                                           transfer->staging_path.string()};
            transfer->staging.close();
            registry_.take(chunk.transfer_id);
            report_failure(*transfer, error);
            return Err<protocol::AckChunk>(std::move(error));
        }

        received = ++transfer->chunks_received;
    }

    const double progress = transfer_progress(received, transfer->size);
    spdlog::debug("Transfer {}: chunk {}/{} ({:.1f}%)",
                  chunk.transfer_id, chunk.index + 1, transfer->total_chunks, progress * 100.0);
    if (bus_) {
        bus_->emit(events::TransferProgressEvent{chunk.transfer_id, transfer->relative_path, received,
                                                 transfer->total_chunks, progress});
    }
    return Ok(protocol::AckChunk{chunk.transfer_id, chunk.index});
}

Result<sync::FileRecord> TransferReceiver::commit(const protocol::CompleteTransfer& complete) {
    auto transfer = registry_.take(complete.transfer_id);
    if (!transfer) {
        return Err<sync::FileRecord>(ErrorKind::Protocol, "Unknown transfer: " + complete.transfer_id);
    }

    std::lock_guard lock(transfer->mutex);
    transfer->staging.close();

    if (transfer->chunks_received != transfer->total_chunks) {
        Error error{ErrorKind::IncompleteTransfer,
                    "Received " + std::to_string(transfer->chunks_received) + " of " +
                        std::to_string(transfer->total_chunks) + " chunks for " + transfer->relative_path};
        report_failure(*transfer, error);
        return Err<sync::FileRecord>(std::move(error));
    }

    std::error_code ec;
    fs::rename(transfer->staging_path, transfer->final_path, ec);
    if (ec) {
        Error error{ErrorKind::Io, "Failed to publish " + transfer->relative_path + ": " + ec.message()};
        report_failure(*transfer, error);
        return Err<sync::FileRecord>(std::move(error));
    }

    // Post-commit metadata: carry the sender's mtime and mark the file as synchronized (read-only).
    fs::last_write_time(transfer->final_path, sync::from_time_t(transfer->record.modified_time), ec);
    if (ec) {
        spdlog::warn("Could not set modification time on {}: {}", transfer->relative_path, ec.message());
    }
    fs::permissions(transfer->final_path,
                    fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write,
                    fs::perm_options::remove, ec);
    if (ec) {
        spdlog::warn("Could not mark {} read-only: {}", transfer->relative_path, ec.message());
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - transfer->started_at);
    spdlog::info("Committed {} ({} bytes) in {} ms", transfer->relative_path, transfer->size, duration.count());
    if (bus_) {
        bus_->emit(events::TransferCommittedEvent{transfer->transfer_id, transfer->relative_path,
                                                  transfer->size, duration});
    }

    sync::FileRecord record = transfer->record;
    record.path = transfer->relative_path;
    return Ok(std::move(record));
}

void TransferReceiver::abort(const std::string& transfer_id, const std::string& reason) {
    auto transfer = registry_.take(transfer_id);
    if (!transfer) {
        return;
    }
    std::lock_guard lock(transfer->mutex);
    transfer->staging.close();
    report_failure(*transfer, Error{ErrorKind::Network, reason});
}

std::optional<double> TransferReceiver::progress(const std::string& transfer_id) const {
    auto transfer = registry_.find(transfer_id);
    if (!transfer) {
        return std::nullopt;
    }
    std::lock_guard lock(transfer->mutex);
    return transfer_progress(transfer->chunks_received, transfer->size);
}

Result<sync::FileRecord> TransferReceiver::receive_file(protocol::EnvelopeChannel& channel,
                                                       const std::optional<std::string>& expected_path) {
    std::string transfer_id;

    auto send_error = [&](const std::string& id, std::optional<std::uint32_t> index, const Error& error) {
        protocol::TransferError message{id, index, error.kind, error.message};
        if (auto res = channel.send(message); res.is_error()) {
            spdlog::warn("Could not report transfer error to peer: {}", res.error().describe());
        }
    };

    while (true) {
        auto envelope = channel.receive();
        if (envelope.is_error()) {
            if (!transfer_id.empty()) {
                abort(transfer_id, envelope.error().message);
            }
            return Err<sync::FileRecord>(envelope.error());
        }
        auto& message = envelope.value();

        if (const auto* start = std::get_if<protocol::StartTransfer>(&message)) {
            if (!transfer_id.empty()) {
                abort(transfer_id, "superseded by a new start-transfer");
                return Err<sync::FileRecord>(ErrorKind::Protocol, "Start-transfer received mid-transfer");
            }
            if (expected_path &&
                fs::path(start->path).generic_string() != fs::path(*expected_path).generic_string()) {
                Error error{ErrorKind::Protocol, "Transfer of " + start->path + " where " + *expected_path +
                                                     " was expected"};
                spdlog::warn("Refusing transfer {}: {}", start->transfer_id, error.message);
                send_error(start->transfer_id, std::nullopt, error);
                return Err<sync::FileRecord>(std::move(error));
            }
            if (auto res = begin(*start); res.is_error()) {
                send_error(start->transfer_id, std::nullopt, res.error());
                return Err<sync::FileRecord>(res.error());
            }
            transfer_id = start->transfer_id;
            continue;
        }

        if (const auto* chunk = std::get_if<protocol::ChunkMessage>(&message)) {
            if (chunk->transfer_id != transfer_id) {
                Error error{ErrorKind::Protocol, "Chunk for unexpected transfer " + chunk->transfer_id};
                send_error(chunk->transfer_id, chunk->index, error);
                abort(transfer_id, error.message);
                return Err<sync::FileRecord>(std::move(error));
            }
            auto ack = accept_chunk(*chunk);
            if (ack.is_error()) {
                send_error(chunk->transfer_id, chunk->index, ack.error());
                return Err<sync::FileRecord>(ack.error());
            }
            if (auto res = channel.send(ack.value()); res.is_error()) {
                abort(transfer_id, res.error().message);
                return Err<sync::FileRecord>(res.error());
            }
            continue;
        }

        if (const auto* complete = std::get_if<protocol::CompleteTransfer>(&message)) {
            if (complete->transfer_id != transfer_id) {
                abort(transfer_id, "complete-transfer for another id");
                return Err<sync::FileRecord>(ErrorKind::Protocol,
                                             "Complete-transfer for unexpected transfer " + complete->transfer_id);
            }
            return commit(*complete);
        }

        if (const auto* error = std::get_if<protocol::TransferError>(&message)) {
            abort(error->transfer_id, error->message);
            return Err<sync::FileRecord>(error->kind, "Peer aborted transfer: " + error->message);
        }

        if (const auto* heartbeat = std::get_if<protocol::Heartbeat>(&message)) {
            if (!heartbeat->reply) {
                if (auto res = channel.send(protocol::Heartbeat{std::time(nullptr), true}); res.is_error()) {
                    abort(transfer_id, res.error().message);
                    return Err<sync::FileRecord>(res.error());
                }
            }
            continue;
        }

        abort(transfer_id, "protocol violation");
        return Err<sync::FileRecord>(ErrorKind::Protocol, std::string("Unexpected ") +
                                                              protocol::envelope_type(message) +
                                                              " during file transfer");
    }
}

} // namespace syncmd::transfer
