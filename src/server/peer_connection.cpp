#include "syncmd/server/peer_connection.hpp"
#include "syncmd/events/events.hpp"
#include "syncmd/sync/merkle_tree.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <set>

namespace syncmd::server {

PeerConnection::PeerConnection(network::ByteStream& stream,
                               std::string peer_address,
                               const ResponderContext& context)
    : stream_(stream),
      channel_(stream),
      context_(context),
      session_(std::move(peer_address)),
      indexer_(context.device_id, context.sync_root) {}

void PeerConnection::serve() {
    spdlog::info("Peer connected: {}", session_.info().peer_address);

    while (!session_.is_terminal()) {
        auto envelope = channel_.receive();
        if (envelope.is_error()) {
            if (channel_.peer_closed()) {
                spdlog::info("Peer {} disconnected", session_.info().peer_address);
                session_.close();
            } else {
                spdlog::warn("Connection {} failed: {}", session_.info().peer_address,
                             envelope.error().describe());
                session_.mark_failed(envelope.error().describe());
            }
            break;
        }

        if (auto res = dispatch(envelope.value()); res.is_error()) {
            const auto& error = res.error();
            if (error.kind == ErrorKind::Protocol) {
                spdlog::warn("Protocol violation from {}: {}", session_.info().peer_address, error.message);
            } else {
                spdlog::error("Dropping connection {}: {}", session_.info().peer_address, error.describe());
            }
            session_.mark_failed(error.describe());
        }
    }

    stream_.close();
    spdlog::info("Session {} ended in state {} after {} sync(s)", session_.info().peer_address,
                 sync::to_string(session_.state()), session_.info().syncs_completed);
}

Result<void> PeerConnection::dispatch(protocol::Envelope& envelope) {
    if (!session_.is_authenticated()) {
        if (const auto* handshake = std::get_if<protocol::HandshakeRequest>(&envelope)) {
            return handle_handshake(*handshake);
        }
        return Err<void>(ErrorKind::Protocol, std::string("Expected handshake_request, got ") +
                                                  protocol::envelope_type(envelope));
    }

    context_.devices.touch(session_.info().peer_device_id);

    if (const auto* request = std::get_if<protocol::SyncRequest>(&envelope)) {
        return handle_sync_request(*request);
    }
    if (const auto* request = std::get_if<protocol::FileRequest>(&envelope)) {
        return handle_file_request(*request);
    }
    if (const auto* heartbeat = std::get_if<protocol::Heartbeat>(&envelope)) {
        return handle_heartbeat(*heartbeat);
    }
    return Err<void>(ErrorKind::Protocol, std::string("Unexpected ") + protocol::envelope_type(envelope) +
                                              " in state " + sync::to_string(session_.state()));
}

Result<void> PeerConnection::handle_handshake(const protocol::HandshakeRequest& request) {
    protocol::HandshakeResponse response;
    response.device_id = context_.device_id;

    auto grant = request.device_id.empty()
                     ? Err<AuthGrant>(ErrorKind::Auth, "Handshake without device id")
                     : context_.authenticator.validate(request);
    if (grant.is_error()) {
        spdlog::warn("Rejected handshake from {} ({}): {}", session_.info().peer_address, request.device_id,
                     grant.error().message);
        response.accepted = false;
        response.message = grant.error().message;
        auto sent = channel_.send(response);
        session_.close();
        return sent;
    }

    if (auto res = session_.authenticate(request.device_id, grant.value().identity); res.is_error()) {
        return res;
    }

    DeviceInfo info;
    info.device_id = request.device_id;
    info.device_name = request.device_name;
    info.address = session_.info().peer_address;
    info.identity = grant.value().identity;
    context_.devices.record_handshake(info);

    response.accepted = true;
    response.identity = grant.value().identity;
    response.message = "Authenticated";

    spdlog::info("Authenticated {} ({}) as {}", request.device_id, request.device_name,
                 grant.value().identity);
    if (context_.bus) {
        context_.bus->emit(events::PeerAuthenticatedEvent{request.device_id, grant.value().identity,
                                                          session_.info().peer_address});
    }
    return channel_.send(response);
}

Result<void> PeerConnection::handle_sync_request(const protocol::SyncRequest& request) {
    const auto started_at = std::chrono::steady_clock::now();
    const auto& peer = session_.info().peer_device_id;

    if (request.device_id != peer) {
        return Err<void>(ErrorKind::Protocol, "Sync request for device " + request.device_id +
                                                  " on a session authenticated as " + peer);
    }
    if (auto res = session_.transition_to(sync::SessionState::Syncing); res.is_error()) {
        return res;
    }

    auto local = indexer_.index();
    if (local.is_error()) {
        return Err<void>(local.error());
    }
    const auto remote = sync::Snapshot::from_records(request.device_id, request.files);

    protocol::SyncResponse response;
    sync::ReconcilePlan plan;
    if (request.root_digest == sync::root_digest(local.value())) {
        spdlog::debug("Root digest of {} matches ours, nothing to reconcile", peer);
    } else {
        plan = resolver_.reconcile(local.value(), remote, context_.devices.base_snapshot(peer));
    }

    std::size_t applied = 0;
    std::set<std::string> requested;
    for (const auto& op : plan.apply_locally) {
        if (const auto* remove = std::get_if<sync::DeleteOp>(&op)) {
            if (auto res = indexer_.delete_file(remove->path); res.is_error()) {
                return res;
            }
            spdlog::info("Deleted {} (removed by {})", remove->path, peer);
            ++applied;
        } else {
            requested.insert(sync::operation_path(op));
        }
    }
    response.operations = plan.apply_remotely;
    response.requested_paths.assign(requested.begin(), requested.end());

    spdlog::info("Sync with {}: {} operation(s) for the peer, {} file(s) requested", peer,
                 response.operations.size(), response.requested_paths.size());
    if (auto res = channel_.send(response); res.is_error()) {
        return res;
    }

    transfer::TransferSender sender(channel_, context_.bus);
    std::size_t files_sent = 0;
    for (const auto& op : response.operations) {
        const auto* record = sync::operation_record(op);
        if (!record) {
            continue;
        }
        auto source = indexer_.resolve(record->path);
        if (source.is_error()) {
            return Err<void>(source.error());
        }
        if (auto sent = sender.send_file(source.value(), *record); sent.is_error()) {
            return Err<void>(sent.error());
        }
        ++files_sent;
    }

    transfer::TransferReceiver receiver(context_.sync_root, context_.transfers, context_.bus);
    // The requester answers in requested_paths order.
    for (const auto& path : response.requested_paths) {
        auto received = receiver.receive_file(channel_, path);
        if (received.is_error()) {
            return Err<void>(received.error());
        }
        ++applied;
    }

    auto settled = indexer_.index();
    if (settled.is_error()) {
        return Err<void>(settled.error());
    }
    context_.devices.store_base_snapshot(peer, std::move(settled.value()));

    if (auto res = session_.transition_to(sync::SessionState::Idle); res.is_error()) {
        return res;
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    spdlog::info("Sync with {} complete: {} applied, {} sent in {} ms", peer, applied, files_sent,
                 duration.count());
    if (context_.bus) {
        context_.bus->emit(events::SyncCompletedEvent{peer, applied, files_sent, duration});
    }
    return Ok();
}

Result<void> PeerConnection::handle_file_request(const protocol::FileRequest& request) {
    protocol::FileResponse response;
    response.path = request.path;

    if (!sync::SnapshotIndexer::is_eligible(request.path)) {
        spdlog::debug("File request for untracked path {}", request.path);
        return channel_.send(response);
    }

    auto record = indexer_.build_record(request.path);
    if (record.is_error()) {
        if (record.error().kind == ErrorKind::PathResolution) {
            return Err<void>(record.error());
        }
        spdlog::debug("File request for {} not found: {}", request.path, record.error().message);
        response.found = false;
        return channel_.send(response);
    }

    response.found = true;
    response.record = record.value();
    if (auto res = channel_.send(response); res.is_error()) {
        return res;
    }

    auto source = indexer_.resolve(request.path);
    if (source.is_error()) {
        return Err<void>(source.error());
    }
    transfer::TransferSender sender(channel_, context_.bus);
    auto sent = sender.send_file(source.value(), record.value());
    if (sent.is_error()) {
        return Err<void>(sent.error());
    }
    return Ok();
}

Result<void> PeerConnection::handle_heartbeat(const protocol::Heartbeat& heartbeat) {
    if (heartbeat.reply) {
        return Ok();
    }
    return channel_.send(protocol::Heartbeat{std::time(nullptr), true});
}

} // namespace syncmd::server
