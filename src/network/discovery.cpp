#include "syncmd/network/discovery.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>

namespace syncmd::network {

std::optional<std::string> parse_discovery_message(const std::string& datagram, const std::string& prefix) {
    if (datagram.size() <= prefix.size() || datagram.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    return datagram.substr(prefix.size());
}

DiscoveryResponder::DiscoveryResponder(std::string device_id, std::string listen_address, std::uint16_t port)
    : device_id_(std::move(device_id)),
      listen_address_(std::move(listen_address)),
      port_(port),
      socket_(io_context_) {}

DiscoveryResponder::~DiscoveryResponder() {
    stop();
}

Result<void> DiscoveryResponder::start() {
    if (running_) {
        return Ok();
    }

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(listen_address_, ec);
    if (ec) {
        return Err<void>(ErrorKind::Network, "Invalid discovery address " + listen_address_ + ": " + ec.message());
    }
    const udp::endpoint endpoint(address, port_);

    socket_.open(endpoint.protocol(), ec);
    if (!ec) {
        socket_.set_option(udp::socket::reuse_address(true), ec);
    }
    if (!ec) {
        socket_.bind(endpoint, ec);
    }
    if (ec) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        return Err<void>(ErrorKind::Network, "Failed to bind discovery port " + std::to_string(port_) + ": " +
                                                 ec.message());
    }
    port_ = socket_.local_endpoint(ec).port();

    running_ = true;
    io_context_.restart();
    do_receive();
    thread_ = std::thread([this] { io_context_.run(); });

    spdlog::info("Discovery responder for {} on UDP {}", device_id_, port_);
    return Ok();
}

void DiscoveryResponder::do_receive() {
    socket_.async_receive_from(
        asio::buffer(buffer_), sender_,
        [this](boost::system::error_code ec, std::size_t bytes) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::warn("Discovery receive failed: {}", ec.message());
                }
                if (ec == asio::error::operation_aborted || !running_) {
                    return;
                }
                do_receive();
                return;
            }

            const std::string datagram(buffer_.data(), bytes);
            const auto peer = parse_discovery_message(datagram, kDiscoverPrefix);
            if (!peer) {
                spdlog::debug("Ignoring datagram from {}", sender_.address().to_string());
            } else if (*peer != device_id_) {
                spdlog::info("Discovery request from {} at {}", *peer, sender_.address().to_string());
                const std::string reply = std::string(kRespondPrefix) + device_id_;
                boost::system::error_code send_ec;
                socket_.send_to(asio::buffer(reply), sender_, 0, send_ec);
                if (send_ec) {
                    spdlog::warn("Discovery reply to {} failed: {}", sender_.address().to_string(),
                                 send_ec.message());
                }
            }

            if (running_) {
                do_receive();
            }
        });
}

void DiscoveryResponder::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    asio::post(io_context_, [this] {
        boost::system::error_code ec;
        socket_.close(ec);
    });
    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("Discovery responder stopped");
}

Result<std::vector<DiscoveredPeer>> discover_peers(const std::string& device_id,
                                                   const std::string& target,
                                                   std::uint16_t port,
                                                   std::chrono::milliseconds timeout) {
    asio::io_context io_context;
    udp::socket socket(io_context);

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(target, ec);
    if (ec) {
        return Err<std::vector<DiscoveredPeer>>(ErrorKind::Network, "Invalid discovery target " + target + ": " +
                                                                        ec.message());
    }

    socket.open(address.is_v6() ? udp::v6() : udp::v4(), ec);
    if (!ec) {
        socket.set_option(asio::socket_base::broadcast(true), ec);
    }
    if (ec) {
        return Err<std::vector<DiscoveredPeer>>(ErrorKind::Network, "Failed to open discovery socket: " +
                                                                        ec.message());
    }

    const std::string announce = std::string(kDiscoverPrefix) + device_id;
    socket.send_to(asio::buffer(announce), udp::endpoint(address, port), 0, ec);
    if (ec) {
        return Err<std::vector<DiscoveredPeer>>(ErrorKind::Network, "Failed to send discovery announce: " +
                                                                        ec.message());
    }

    std::vector<DiscoveredPeer> peers;
    std::array<char, 512> buffer{};
    udp::endpoint sender;

    std::function<void()> receive = [&] {
        socket.async_receive_from(asio::buffer(buffer), sender, [&](boost::system::error_code rec, std::size_t bytes) {
            if (rec) {
                return;
            }
            const auto peer = parse_discovery_message(std::string(buffer.data(), bytes), kRespondPrefix);
            if (peer && *peer != device_id) {
                const bool known = std::any_of(peers.begin(), peers.end(),
                                               [&](const DiscoveredPeer& p) { return p.device_id == *peer; });
                if (!known) {
                    spdlog::info("Discovered {} at {}", *peer, sender.address().to_string());
                    peers.push_back({*peer, sender.address().to_string()});
                }
            }
            receive();
        });
    };

    receive();
    io_context.run_for(timeout);

    boost::system::error_code ignored;
    socket.close(ignored);
    return Ok(std::move(peers));
}

} // namespace syncmd::network
