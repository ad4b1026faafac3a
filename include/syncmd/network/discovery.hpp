#pragma once

#include "syncmd/core/result.hpp"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace syncmd::network {

namespace asio = boost::asio;
using udp = asio::ip::udp;

constexpr const char* kDiscoverPrefix = "DISCOVER:";
constexpr const char* kRespondPrefix = "RESPOND:";

/**
 * @brief Device id carried by "<prefix><device_id>", if @p datagram has that shape
 */
std::optional<std::string> parse_discovery_message(const std::string& datagram, const std::string& prefix);

struct DiscoveredPeer {
    std::string device_id;
    std::string address;
};

/**
 * @brief Answers discovery announces on a UDP port
 *
 * Announces from our own device id are ignored; anything that is not an
 * announce is dropped with a debug log.
 */
class DiscoveryResponder {
public:
    DiscoveryResponder(std::string device_id, std::string listen_address, std::uint16_t port);
    ~DiscoveryResponder();

    DiscoveryResponder(const DiscoveryResponder&) = delete;
    DiscoveryResponder& operator=(const DiscoveryResponder&) = delete;

    Result<void> start();
    void stop();

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

private:
    void do_receive();

    std::string device_id_;
    std::string listen_address_;
    std::uint16_t port_;

    asio::io_context io_context_;
    udp::socket socket_;
    udp::endpoint sender_;
    std::array<char, 512> buffer_{};
    std::thread thread_;
    std::atomic<bool> running_{false};
};

/**
 * @brief Send "DISCOVER:<device_id>" to target:port and collect replies until @p timeout
 *
 * @param target Broadcast or unicast address
 */
Result<std::vector<DiscoveredPeer>> discover_peers(const std::string& device_id,
                                                   const std::string& target,
                                                   std::uint16_t port,
                                                   std::chrono::milliseconds timeout);

} // namespace syncmd::network
