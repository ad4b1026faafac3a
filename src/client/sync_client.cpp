#include "syncmd/client/sync_client.hpp"
#include "syncmd/events/events.hpp"
#include "syncmd/sync/merkle_tree.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <filesystem>

namespace syncmd::client {
namespace fs = std::filesystem;

const char* to_string(SyncOutcome outcome) {
    switch (outcome) {
        case SyncOutcome::Completed: return "completed";
        case SyncOutcome::Skipped: return "skipped";
    }
    return "unknown";
}

SyncClient::SyncClient(NodeConfig config, events::EventBus* bus)
    : config_(std::move(config)),
      bus_(bus),
      indexer_(config_.device_id, config_.sync_root),
      debouncer_(config_.debounce_window) {}

SyncClient::~SyncClient() {
    stop();
    close();
}

Result<void> SyncClient::connect() {
    std::lock_guard lock(connection_mutex_);
    return connect_locked();
}

Result<void> SyncClient::handshake() {
    std::lock_guard lock(connection_mutex_);
    return handshake_locked();
}

Result<void> SyncClient::connect_locked() {
    if (stream_) {
        return Ok();
    }

    auto stream = network::TcpStream::connect(io_context_, config_.peer_address, config_.peer_port);
    if (stream.is_error()) {
        return Err<void>(stream.error());
    }
    stream_ = std::move(stream.value());
    stream_->set_read_timeout(config_.read_timeout);
    channel_ = std::make_unique<protocol::EnvelopeChannel>(*stream_);
    session_ = std::make_unique<sync::PeerSession>(config_.peer_address + ":" + std::to_string(config_.peer_port));
    return Ok();
}

Result<std::string> SyncClient::build_credential() const {
    if (config_.credential_mode == CredentialMode::Token) {
        return Ok(config_.auth_token);
    }
    auto snapshot = indexer_.index();
    if (snapshot.is_error()) {
        return Err<std::string>(snapshot.error());
    }
    return Ok(sync::root_digest(snapshot.value()));
}

Result<void> SyncClient::handshake_locked() {
    if (!session_) {
        return Err<void>(ErrorKind::Network, "Not connected");
    }
    if (session_->is_authenticated()) {
        return Ok();
    }

    auto credential = build_credential();
    if (credential.is_error()) {
        return Err<void>(credential.error());
    }

    protocol::HandshakeRequest request;
    request.device_id = config_.device_id;
    request.device_name = config_.device_name;
    request.credential_mode = to_string(config_.credential_mode);
    request.credential = std::move(credential.value());

    if (auto res = channel_->send(request); res.is_error()) {
        drop_connection_locked(res.error());
        return res;
    }

    auto reply = receive_reply();
    if (reply.is_error()) {
        drop_connection_locked(reply.error());
        return Err<void>(reply.error());
    }
    const auto* response = std::get_if<protocol::HandshakeResponse>(&reply.value());
    if (!response) {
        Error error{ErrorKind::Protocol, std::string("Expected handshake_response, got ") +
                                             protocol::envelope_type(reply.value())};
        drop_connection_locked(error);
        return Err<void>(std::move(error));
    }

    if (!response->accepted) {
        spdlog::warn("Handshake rejected by {}: {}", config_.peer_address, response->message);
        session_->close();
        close_locked();
        return Err<void>(ErrorKind::Network, "Handshake rejected: " + response->message);
    }

    if (auto res = session_->authenticate(response->device_id, response->identity); res.is_error()) {
        drop_connection_locked(res.error());
        return res;
    }
    peer_device_id_ = response->device_id;
    spdlog::info("Authenticated with {} as {}", response->device_id, response->identity);
    if (bus_) {
        bus_->emit(events::PeerAuthenticatedEvent{response->device_id, response->identity,
                                                  session_->info().peer_address});
    }
    return Ok();
}

Result<protocol::Envelope> SyncClient::receive_reply() {
    while (true) {
        auto envelope = channel_->receive();
        if (envelope.is_error()) {
            return envelope;
        }
        if (const auto* heartbeat = std::get_if<protocol::Heartbeat>(&envelope.value())) {
            if (!heartbeat->reply) {
                if (auto res = channel_->send(protocol::Heartbeat{std::time(nullptr), true}); res.is_error()) {
                    return Err<protocol::Envelope>(res.error());
                }
            }
            continue;
        }
        if (const auto* error = std::get_if<protocol::TransferError>(&envelope.value())) {
            return Err<protocol::Envelope>(error->kind, "Peer reported: " + error->message);
        }
        return envelope;
    }
}

Result<SyncOutcome> SyncClient::sync_once() {
    std::unique_lock lock(connection_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        spdlog::debug("Sync skipped: connection busy");
        return Ok(SyncOutcome::Skipped);
    }

    if (auto res = connect_locked(); res.is_error()) {
        return Err<SyncOutcome>(res.error());
    }
    if (auto res = handshake_locked(); res.is_error()) {
        return Err<SyncOutcome>(res.error());
    }
    if (auto res = sync_locked(); res.is_error()) {
        drop_connection_locked(res.error());
        return Err<SyncOutcome>(res.error());
    }
    return Ok(SyncOutcome::Completed);
}

Result<void> SyncClient::sync_locked() {
    const auto started_at = std::chrono::steady_clock::now();

    auto local = indexer_.index();
    if (local.is_error()) {
        return Err<void>(local.error());
    }

    protocol::SyncRequest request;
    request.device_id = config_.device_id;
    request.root_digest = sync::root_digest(local.value());
    request.files = local.value().records();

    if (auto res = session_->transition_to(sync::SessionState::Syncing); res.is_error()) {
        return res;
    }
    spdlog::info("Requesting sync with {} ({} local files)", peer_device_id_, request.files.size());
    if (auto res = channel_->send(request); res.is_error()) {
        return res;
    }

    auto reply = receive_reply();
    if (reply.is_error()) {
        return Err<void>(reply.error());
    }
    auto* response = std::get_if<protocol::SyncResponse>(&reply.value());
    if (!response) {
        return Err<void>(ErrorKind::Protocol, std::string("Expected sync_response, got ") +
                                                  protocol::envelope_type(reply.value()));
    }

    transfer::TransferReceiver receiver(config_.sync_root, transfers_, bus_);
    std::size_t applied = 0;
    for (const auto& op : response->operations) {
        if (const auto* remove = std::get_if<sync::DeleteOp>(&op)) {
            if (auto res = indexer_.delete_file(remove->path); res.is_error()) {
                return res;
            }
            spdlog::info("Deleted {} (removed on {})", remove->path, peer_device_id_);
            ++applied;
            continue;
        }

        auto received = receiver.receive_file(*channel_, sync::operation_path(op));
        if (received.is_error()) {
            return Err<void>(received.error());
        }
        ++applied;
    }

    transfer::TransferSender sender(*channel_, bus_);
    std::size_t files_sent = 0;
    for (const auto& path : response->requested_paths) {
        auto record = indexer_.build_record(path);
        if (record.is_error()) {
            return Err<void>(record.error());
        }
        auto source = indexer_.resolve(path);
        if (source.is_error()) {
            return Err<void>(source.error());
        }
        if (auto sent = sender.send_file(source.value(), record.value()); sent.is_error()) {
            return Err<void>(sent.error());
        }
        ++files_sent;
    }

    if (auto res = session_->transition_to(sync::SessionState::Idle); res.is_error()) {
        return res;
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    spdlog::info("Sync with {} complete: {} applied, {} sent in {} ms", peer_device_id_, applied, files_sent,
                 duration.count());
    if (bus_) {
        bus_->emit(events::SyncCompletedEvent{peer_device_id_, applied, files_sent, duration});
    }
    return Ok();
}

Result<void> SyncClient::heartbeat() {
    std::unique_lock lock(connection_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return Ok();
    }
    if (!session_ || !session_->is_authenticated()) {
        return Err<void>(ErrorKind::Network, "Not connected");
    }

    if (auto res = channel_->send(protocol::Heartbeat{std::time(nullptr), false}); res.is_error()) {
        drop_connection_locked(res.error());
        return res;
    }
    while (true) {
        auto envelope = channel_->receive();
        if (envelope.is_error()) {
            drop_connection_locked(envelope.error());
            return Err<void>(envelope.error());
        }
        const auto* heartbeat = std::get_if<protocol::Heartbeat>(&envelope.value());
        if (!heartbeat) {
            Error error{ErrorKind::Protocol, std::string("Expected heartbeat, got ") +
                                                 protocol::envelope_type(envelope.value())};
            drop_connection_locked(error);
            return Err<void>(std::move(error));
        }
        if (heartbeat->reply) {
            return Ok();
        }
        if (auto res = channel_->send(protocol::Heartbeat{std::time(nullptr), true}); res.is_error()) {
            drop_connection_locked(res.error());
            return res;
        }
    }
}

Result<sync::FileRecord> SyncClient::fetch_file(const std::string& relative_path) {
    std::lock_guard lock(connection_mutex_);
    if (auto res = connect_locked(); res.is_error()) {
        return Err<sync::FileRecord>(res.error());
    }
    if (auto res = handshake_locked(); res.is_error()) {
        return Err<sync::FileRecord>(res.error());
    }

    if (auto res = channel_->send(protocol::FileRequest{relative_path}); res.is_error()) {
        drop_connection_locked(res.error());
        return Err<sync::FileRecord>(res.error());
    }

    auto reply = receive_reply();
    if (reply.is_error()) {
        drop_connection_locked(reply.error());
        return Err<sync::FileRecord>(reply.error());
    }
    const auto* response = std::get_if<protocol::FileResponse>(&reply.value());
    if (!response) {
        Error error{ErrorKind::Protocol, std::string("Expected file_response, got ") +
                                             protocol::envelope_type(reply.value())};
        drop_connection_locked(error);
        return Err<sync::FileRecord>(std::move(error));
    }
    if (!response->found) {
        return Err<sync::FileRecord>(ErrorKind::Io, "File not found on peer: " + relative_path);
    }

    transfer::TransferReceiver receiver(config_.sync_root, transfers_, bus_);
    auto received = receiver.receive_file(*channel_, relative_path);
    if (received.is_error()) {
        drop_connection_locked(received.error());
    }
    return received;
}

void SyncClient::drop_connection_locked(const Error& error) {
    if (session_) {
        session_->mark_failed(error.describe());
    }
    spdlog::warn("Dropping connection to {}: {}", config_.peer_address, error.describe());
    close_locked();
}

void SyncClient::close_locked() {
    if (session_ && !session_->is_terminal()) {
        session_->close();
    }
    channel_.reset();
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
}

void SyncClient::close() {
    std::lock_guard lock(connection_mutex_);
    close_locked();
}

bool SyncClient::is_connected() const {
    std::lock_guard lock(connection_mutex_);
    return stream_ != nullptr;
}

std::optional<sync::SessionInfo> SyncClient::session_info() const {
    std::lock_guard lock(connection_mutex_);
    if (!session_) {
        return std::nullopt;
    }
    return session_->info();
}

std::string SyncClient::peer_device_id() const {
    std::lock_guard lock(connection_mutex_);
    return peer_device_id_;
}

void SyncClient::start_periodic(std::chrono::seconds interval) {
    stop();
    {
        std::lock_guard lock(periodic_mutex_);
        stopping_ = false;
    }

    periodic_thread_ = std::thread([this, interval] {
        std::unique_lock lock(periodic_mutex_);
        while (!periodic_cv_.wait_for(lock, interval, [this] { return stopping_; })) {
            lock.unlock();
            auto outcome = sync_once();
            if (outcome.is_error()) {
                spdlog::error("Periodic sync failed: {}", outcome.error().describe());
            } else if (outcome.value() == SyncOutcome::Skipped) {
                spdlog::debug("Periodic sync skipped");
            }
            lock.lock();
        }
    });
    spdlog::info("Periodic sync every {} s", interval.count());
}

void SyncClient::stop() {
    {
        std::lock_guard lock(periodic_mutex_);
        stopping_ = true;
    }
    periodic_cv_.notify_all();
    if (periodic_thread_.joinable()) {
        periodic_thread_.join();
    }
}

std::string SyncClient::relative_to_root(const std::string& path) const {
    const fs::path candidate(path);
    if (!candidate.is_absolute()) {
        return candidate.generic_string();
    }
    const auto relative = candidate.lexically_normal().lexically_relative(config_.sync_root.lexically_normal());
    if (relative.empty() || *relative.begin() == "..") {
        return {};
    }
    return relative.generic_string();
}

Result<SyncOutcome> SyncClient::notify_change(const ChangeEvent& event) {
    const auto relative = relative_to_root(event.path);
    if (relative.empty() || !sync::SnapshotIndexer::is_eligible(relative)) {
        spdlog::debug("Ignoring {} event for {}", to_string(event.kind), event.path);
        return Ok(SyncOutcome::Skipped);
    }
    if (!debouncer_.should_trigger(relative)) {
        return Ok(SyncOutcome::Skipped);
    }
    spdlog::info("Change detected: {} {}", to_string(event.kind), relative);
    return sync_once();
}

} // namespace syncmd::client
