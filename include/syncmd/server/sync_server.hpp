#pragma once

#include "syncmd/core/config.hpp"
#include "syncmd/core/result.hpp"
#include "syncmd/server/peer_connection.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace syncmd::server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Sync responder listening for peers
 *
 * Architecture:
 * - Async accept on a private io_context, run by one background thread
 * - Each accepted socket is handed to its own worker thread, which owns it
 *   for the lifetime of the connection (blocking, stop-and-wait I/O)
 * - Workers share only the device registry and the transfer registry
 *
 * Usage:
 * ```cpp
 * SyncServer server(config, authority, devices, transfers);
 * server.start();
 * ...
 * server.stop();  // closes the acceptor, shuts down peers, joins workers
 * ```
 */
class SyncServer {
public:
    SyncServer(NodeConfig config,
               const Authenticator& authenticator,
               DeviceRegistry& devices,
               transfer::TransferRegistry& transfers,
               events::EventBus* bus = nullptr);
    ~SyncServer();

    SyncServer(const SyncServer&) = delete;
    SyncServer& operator=(const SyncServer&) = delete;

    /**
     * @brief Bind config.listen_address:listen_port and start accepting
     *
     * A listen port of 0 lets the OS choose; port() reports the result.
     */
    Result<void> start();

    void stop();

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    [[nodiscard]] bool is_running() const noexcept { return running_; }
    [[nodiscard]] std::size_t active_connections() const;

private:
    struct Worker {
        std::shared_ptr<network::TcpStream> stream;
        std::shared_ptr<std::atomic<bool>> finished;
        std::thread thread;
    };

    void do_accept();
    void spawn_worker(tcp::socket socket);
    void reap_finished_workers();

    NodeConfig config_;
    ResponderContext context_;

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};
    std::uint16_t port_ = 0;

    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

} // namespace syncmd::server
