#include "syncmd/server/sync_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace syncmd::server {

SyncServer::SyncServer(NodeConfig config,
                       const Authenticator& authenticator,
                       DeviceRegistry& devices,
                       transfer::TransferRegistry& transfers,
                       events::EventBus* bus)
    : config_(std::move(config)),
      context_{config_.device_id, config_.sync_root, authenticator, devices, transfers, bus},
      acceptor_(io_context_) {}

SyncServer::~SyncServer() {
    stop();
}

Result<void> SyncServer::start() {
    if (running_) {
        return Err<void>(ErrorKind::Network, "Server already running");
    }

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(config_.listen_address, ec);
    if (ec) {
        return Err<void>(ErrorKind::Network, "Invalid listen address " + config_.listen_address + ": " +
                                                 ec.message());
    }
    const tcp::endpoint endpoint(address, config_.listen_port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return Err<void>(ErrorKind::Network, "Failed to listen on " + config_.listen_address + ":" +
                                                 std::to_string(config_.listen_port) + ": " + ec.message());
    }

    port_ = acceptor_.local_endpoint(ec).port();
    running_ = true;

    io_context_.restart();
    do_accept();
    io_thread_ = std::thread([this] { io_context_.run(); });

    spdlog::info("Sync server {} listening on {}:{} (root {})", config_.device_id, config_.listen_address,
                 port_, config_.sync_root.string());
    return Ok();
}

void SyncServer::do_accept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (!ec) {
            reap_finished_workers();
            spawn_worker(std::move(socket));
        } else if (ec != asio::error::operation_aborted) {
            spdlog::error("Accept error: {}", ec.message());
        }

        if (running_ && acceptor_.is_open()) {
            do_accept();
        }
    });
}

void SyncServer::spawn_worker(tcp::socket socket) {
    boost::system::error_code ec;
    socket.set_option(tcp::no_delay(true), ec);

    auto stream = std::make_shared<network::TcpStream>(std::move(socket));
    stream->set_read_timeout(config_.read_timeout);
    auto finished = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard lock(workers_mutex_);
    Worker worker;
    worker.stream = stream;
    worker.finished = finished;
    worker.thread = std::thread([this, stream, finished] {
        PeerConnection connection(*stream, stream->remote_address(), context_);
        connection.serve();
        finished->store(true);
    });
    workers_.push_back(std::move(worker));
}

void SyncServer::reap_finished_workers() {
    std::list<Worker> done;
    {
        std::lock_guard lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->finished->load()) {
                done.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : done) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

std::size_t SyncServer::active_connections() const {
    std::lock_guard lock(workers_mutex_);
    return static_cast<std::size_t>(std::count_if(workers_.begin(), workers_.end(),
                                                  [](const Worker& w) { return !w.finished->load(); }));
}

void SyncServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::post(io_context_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    std::list<Worker> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        worker.stream->shutdown();
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    spdlog::info("Sync server {} stopped", config_.device_id);
}

} // namespace syncmd::server
