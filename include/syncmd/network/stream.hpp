#pragma once

#include "syncmd/core/result.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace syncmd::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Reliable, ordered, bidirectional byte stream
 *
 * Owned by exactly one task at a time; implementations need no internal
 * locking for reads and writes.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual Result<void> write_all(const std::uint8_t* data, std::size_t size) = 0;
    virtual Result<void> read_exact(std::uint8_t* data, std::size_t size) = 0;

    /// True once a read observed an orderly shutdown by the peer.
    [[nodiscard]] virtual bool peer_closed() const noexcept = 0;

    virtual void close() = 0;
};

/**
 * @brief Blocking TCP stream over a Boost.Asio socket
 *
 * Reads optionally wait at most read_timeout for data; zero waits forever.
 */
class TcpStream : public ByteStream {
public:
    explicit TcpStream(tcp::socket socket);
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    static Result<std::unique_ptr<TcpStream>> connect(asio::io_context& io_context,
                                                      const std::string& host,
                                                      std::uint16_t port);

    Result<void> write_all(const std::uint8_t* data, std::size_t size) override;
    Result<void> read_exact(std::uint8_t* data, std::size_t size) override;

    [[nodiscard]] bool peer_closed() const noexcept override { return peer_closed_; }

    void close() override;

    /**
     * @brief Unblock a pending read from another thread; the owner still calls close()
     *
     * Acts on the native descriptor only, never on the asio socket object the
     * owning thread is reading through.
     */
    void shutdown();

    void set_read_timeout(std::chrono::milliseconds timeout) { read_timeout_ = timeout; }

    [[nodiscard]] std::string remote_address() const;

private:
    Result<void> wait_readable();

    tcp::socket socket_;
    // -1 once closed, so a late shutdown() cannot hit a reused descriptor.
    tcp::socket::native_handle_type native_handle_;
    std::mutex handle_mutex_;
    std::chrono::milliseconds read_timeout_{0};
    bool peer_closed_ = false;
};

} // namespace syncmd::network
