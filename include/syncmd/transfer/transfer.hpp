#pragma once

#include "syncmd/core/result.hpp"
#include "syncmd/events/event_bus.hpp"
#include "syncmd/protocol/channel.hpp"
#include "syncmd/protocol/envelope.hpp"
#include "syncmd/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace syncmd::transfer {

constexpr std::size_t kChunkSize = 64 * 1024;

/// ceil(size / chunk_size)
std::uint32_t chunk_count(std::uint64_t size, std::size_t chunk_size = kChunkSize);

/// chunks_received * chunk_size / size, capped at 1; an empty file is complete.
double transfer_progress(std::uint32_t chunks_received, std::uint64_t size, std::size_t chunk_size = kChunkSize);

/// Receiver-side staging file for a final path: "<final_path>.tmp".
std::filesystem::path staging_path_for(const std::filesystem::path& final_path);

enum class SenderState {
    Idle,
    HeaderSent,
    ChunkSent,
    AckAwaited,
    CompleteSent,
    Failed
};

const char* to_string(SenderState state);

/**
 * @brief Sending half of the stop-and-wait chunk protocol
 *
 * Each chunk waits for its acknowledge (or a transfer error) before the
 * next one is read. Heartbeats arriving in between are answered in kind.
 */
class TransferSender {
public:
    using ChunkHook = std::function<void(protocol::ChunkMessage&)>;

    explicit TransferSender(protocol::EnvelopeChannel& channel,
                            events::EventBus* bus = nullptr,
                            std::size_t chunk_size = kChunkSize);

    /**
     * @brief Stream @p source to the peer under a fresh transfer id
     *
     * @param record Metadata applied by the receiver on commit; record.path is
     *               the destination path relative to the receiver's root
     * @return The transfer id used
     */
    Result<std::string> send_file(const std::filesystem::path& source, const sync::FileRecord& record);

    /// Invoked on every chunk after its digest is computed, before it is sent.
    void set_chunk_hook(ChunkHook hook) { chunk_hook_ = std::move(hook); }

    [[nodiscard]] SenderState state() const noexcept { return state_; }

private:
    Result<void> await_ack(const std::string& transfer_id, std::uint32_t index);
    Result<std::string> fail(Error error);

    protocol::EnvelopeChannel& channel_;
    events::EventBus* bus_;
    std::size_t chunk_size_;
    SenderState state_ = SenderState::Idle;
    ChunkHook chunk_hook_;
};

/**
 * @brief Receiver-side state for one in-flight transfer
 */
struct ActiveTransfer {
    std::string transfer_id;
    std::string relative_path;
    std::filesystem::path final_path;
    std::filesystem::path staging_path;
    std::uint64_t size = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t chunks_received = 0;
    sync::FileRecord record;
    std::ofstream staging;
    std::chrono::steady_clock::time_point started_at{};
    std::mutex mutex;  ///< Serialises chunk appends for this transfer
};

/**
 * @brief Active transfers keyed by transfer id, shared by every connection
 *
 * At most one in-flight transfer per id. Lookups hold the registry lock only
 * long enough to find or swap the entry.
 */
class TransferRegistry {
public:
    Result<void> insert(std::shared_ptr<ActiveTransfer> transfer);
    std::shared_ptr<ActiveTransfer> find(const std::string& transfer_id) const;
    std::shared_ptr<ActiveTransfer> take(const std::string& transfer_id);

    [[nodiscard]] bool contains(const std::string& transfer_id) const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ActiveTransfer>> transfers_;
};

/**
 * @brief Receiving half: stages chunks and publishes by atomic rename
 *
 * A checksum failure drops the in-memory state but leaves the staging file
 * on disk. Nothing is ever written under the final name except by the
 * rename in commit().
 */
class TransferReceiver {
public:
    TransferReceiver(std::filesystem::path root,
                     TransferRegistry& registry,
                     events::EventBus* bus = nullptr);

    Result<void> begin(const protocol::StartTransfer& start);
    Result<protocol::AckChunk> accept_chunk(const protocol::ChunkMessage& chunk);
    Result<sync::FileRecord> commit(const protocol::CompleteTransfer& complete);
    void abort(const std::string& transfer_id, const std::string& reason);

    /**
     * @brief Drive one full transfer exchange on @p channel
     *
     * Expects start, chunks, complete. Replies with acknowledges or a
     * transfer error, and returns the committed record.
     *
     * @param expected_path When set, a start-transfer naming any other path
     *                      is refused with a Protocol error before anything
     *                      is staged
     */
    Result<sync::FileRecord> receive_file(protocol::EnvelopeChannel& channel,
                                          const std::optional<std::string>& expected_path = std::nullopt);

    [[nodiscard]] std::optional<double> progress(const std::string& transfer_id) const;

private:
    Result<std::filesystem::path> resolve(const std::string& relative_path) const;
    void report_failure(const ActiveTransfer& transfer, const Error& error);

    std::filesystem::path root_;
    TransferRegistry& registry_;
    events::EventBus* bus_;
};

} // namespace syncmd::transfer
