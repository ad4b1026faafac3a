#pragma once

#include "syncmd/core/result.hpp"
#include "syncmd/network/stream.hpp"
#include "syncmd/protocol/envelope.hpp"

namespace syncmd::protocol {

/**
 * @brief Length-delimited envelope exchange over a ByteStream
 *
 * Reads and writes happen in call order on the caller's thread; nothing is
 * buffered or reordered.
 */
class EnvelopeChannel {
public:
    explicit EnvelopeChannel(network::ByteStream& stream) : stream_(stream) {}

    Result<void> send(const Envelope& envelope);
    Result<Envelope> receive();

    [[nodiscard]] bool peer_closed() const noexcept { return stream_.peer_closed(); }

    network::ByteStream& stream() noexcept { return stream_; }

private:
    network::ByteStream& stream_;
};

} // namespace syncmd::protocol
