#pragma once

#include "syncmd/client/change_debouncer.hpp"
#include "syncmd/core/config.hpp"
#include "syncmd/core/result.hpp"
#include "syncmd/events/event_bus.hpp"
#include "syncmd/network/stream.hpp"
#include "syncmd/protocol/channel.hpp"
#include "syncmd/sync/indexer.hpp"
#include "syncmd/sync/session.hpp"
#include "syncmd/transfer/transfer.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace syncmd::client {

enum class SyncOutcome {
    Completed,
    Skipped  ///< Connection busy with another exchange, or trigger filtered out
};

const char* to_string(SyncOutcome outcome);

/**
 * @brief Initiator side of the session protocol over one outbound connection
 *
 * CONCURRENCY:
 * The periodic timer and change notifications both drive sync_once(). The
 * connection is guarded by a mutex taken with try_lock, so an attempt that
 * finds it busy is skipped rather than queued. A failed exchange drops the
 * connection; the next attempt reconnects.
 */
class SyncClient {
public:
    explicit SyncClient(NodeConfig config, events::EventBus* bus = nullptr);
    ~SyncClient();

    SyncClient(const SyncClient&) = delete;
    SyncClient& operator=(const SyncClient&) = delete;

    Result<void> connect();
    Result<void> handshake();

    /**
     * @brief One full bidirectional sync exchange
     *
     * Connects and authenticates first when needed.
     */
    Result<SyncOutcome> sync_once();

    /// Sends a heartbeat and waits for the reply; a busy connection counts as alive.
    Result<void> heartbeat();

    /**
     * @brief Download one file from the peer into the local root
     */
    Result<sync::FileRecord> fetch_file(const std::string& relative_path);

    void close();

    void start_periodic(std::chrono::seconds interval);
    void stop();

    /**
     * @brief Best-effort sync trigger from the filesystem watcher
     *
     * Ineligible paths and events collapsed by the debouncer are Skipped.
     */
    Result<SyncOutcome> notify_change(const ChangeEvent& event);

    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] std::optional<sync::SessionInfo> session_info() const;
    [[nodiscard]] std::string peer_device_id() const;

private:
    Result<void> connect_locked();
    Result<void> handshake_locked();
    Result<void> sync_locked();
    Result<protocol::Envelope> receive_reply();
    Result<std::string> build_credential() const;
    void drop_connection_locked(const Error& error);
    void close_locked();
    std::string relative_to_root(const std::string& path) const;

    NodeConfig config_;
    events::EventBus* bus_;
    sync::SnapshotIndexer indexer_;
    transfer::TransferRegistry transfers_;
    ChangeDebouncer debouncer_;

    boost::asio::io_context io_context_;
    std::unique_ptr<network::TcpStream> stream_;
    std::unique_ptr<protocol::EnvelopeChannel> channel_;
    std::unique_ptr<sync::PeerSession> session_;
    std::string peer_device_id_;
    mutable std::mutex connection_mutex_;

    std::thread periodic_thread_;
    std::mutex periodic_mutex_;
    std::condition_variable periodic_cv_;
    bool stopping_ = false;
};

} // namespace syncmd::client
