#include "syncmd/network/stream.hpp"

#include <spdlog/spdlog.h>

#include <poll.h>
#include <sys/socket.h>

namespace syncmd::network {

TcpStream::TcpStream(tcp::socket socket)
    : socket_(std::move(socket)),
      native_handle_(socket_.is_open() ? socket_.native_handle() : -1) {
}

TcpStream::~TcpStream() {
    close();
}

Result<std::unique_ptr<TcpStream>> TcpStream::connect(asio::io_context& io_context,
                                                      const std::string& host,
                                                      std::uint16_t port) {
    boost::system::error_code ec;
    tcp::resolver resolver(io_context);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return Err<std::unique_ptr<TcpStream>>(ErrorKind::Network,
                                               "Failed to resolve " + host + ": " + ec.message());
    }

    tcp::socket socket(io_context);
    asio::connect(socket, endpoints, ec);
    if (ec) {
        return Err<std::unique_ptr<TcpStream>>(ErrorKind::Network, "Failed to connect to " + host + ":" +
                                                                       std::to_string(port) + ": " + ec.message());
    }

    socket.set_option(tcp::no_delay(true), ec);
    spdlog::info("Connected to {}:{}", host, port);
    return Ok(std::make_unique<TcpStream>(std::move(socket)));
}

Result<void> TcpStream::write_all(const std::uint8_t* data, std::size_t size) {
    boost::system::error_code ec;
    asio::write(socket_, asio::buffer(data, size), ec);
    if (ec) {
        return Err<void>(ErrorKind::Network, "Write failed: " + ec.message());
    }
    return Ok();
}

Result<void> TcpStream::wait_readable() {
    if (read_timeout_.count() <= 0) {
        return Ok();
    }

    pollfd descriptor{};
    descriptor.fd = socket_.native_handle();
    descriptor.events = POLLIN;
    const int ready = ::poll(&descriptor, 1, static_cast<int>(read_timeout_.count()));
    if (ready == 0) {
        return Err<void>(ErrorKind::Network,
                         "Timed out after " + std::to_string(read_timeout_.count()) + " ms waiting for peer");
    }
    if (ready < 0) {
        return Err<void>(ErrorKind::Network, "poll() failed while waiting for peer");
    }
    return Ok();
}

Result<void> TcpStream::read_exact(std::uint8_t* data, std::size_t size) {
    std::size_t received = 0;
    while (received < size) {
        if (auto ready = wait_readable(); ready.is_error()) {
            return ready;
        }

        boost::system::error_code ec;
        const auto count = socket_.read_some(asio::buffer(data + received, size - received), ec);
        if (ec == asio::error::eof) {
            peer_closed_ = true;
            return Err<void>(ErrorKind::Network, "Connection closed by peer");
        }
        if (ec) {
            return Err<void>(ErrorKind::Network, "Read failed: " + ec.message());
        }
        received += count;
    }
    return Ok();
}

void TcpStream::shutdown() {
    // Called from a thread other than the reader's, so the asio socket object is not touched.
    std::lock_guard lock(handle_mutex_);
    if (native_handle_ >= 0) {
        ::shutdown(native_handle_, SHUT_RDWR);
    }
}

void TcpStream::close() {
    std::lock_guard lock(handle_mutex_);
    native_handle_ = -1;
    if (socket_.is_open()) {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        spdlog::debug("Stream closed");
    }
}

std::string TcpStream::remote_address() const {
    boost::system::error_code ec;
    const auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace syncmd::network
