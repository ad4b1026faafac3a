#pragma once

#include "syncmd/events/event_bus.hpp"
#include "syncmd/network/stream.hpp"
#include "syncmd/protocol/channel.hpp"
#include "syncmd/server/auth.hpp"
#include "syncmd/server/device_registry.hpp"
#include "syncmd/sync/conflict.hpp"
#include "syncmd/sync/indexer.hpp"
#include "syncmd/sync/session.hpp"
#include "syncmd/transfer/transfer.hpp"

#include <filesystem>
#include <string>

namespace syncmd::server {

/**
 * @brief Everything a connection shares with its server
 *
 * The referenced objects are owned by the server and outlive every connection.
 */
struct ResponderContext {
    std::string device_id;
    std::filesystem::path sync_root;
    const Authenticator& authenticator;
    DeviceRegistry& devices;
    transfer::TransferRegistry& transfers;
    events::EventBus* bus = nullptr;
};

/**
 * @brief Responder side of the session protocol for one connection
 *
 * Lifecycle:
 * 1. Created by the server thread that accepted the socket
 * 2. serve() reads envelopes until the peer leaves or violates the protocol
 * 3. The stream is closed before serve() returns
 *
 * Only the owning thread reads or writes the stream.
 */
class PeerConnection {
public:
    PeerConnection(network::ByteStream& stream, std::string peer_address, const ResponderContext& context);

    /// Blocks until the session reaches Closed or Error.
    void serve();

    [[nodiscard]] const sync::SessionInfo& session_info() const noexcept { return session_.info(); }

private:
    Result<void> dispatch(protocol::Envelope& envelope);

    Result<void> handle_handshake(const protocol::HandshakeRequest& request);
    Result<void> handle_sync_request(const protocol::SyncRequest& request);
    Result<void> handle_file_request(const protocol::FileRequest& request);
    Result<void> handle_heartbeat(const protocol::Heartbeat& heartbeat);

    network::ByteStream& stream_;
    protocol::EnvelopeChannel channel_;
    const ResponderContext& context_;
    sync::PeerSession session_;
    sync::SnapshotIndexer indexer_;
    sync::ConflictResolver resolver_;
};

} // namespace syncmd::server
