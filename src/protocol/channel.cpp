#include "syncmd/protocol/channel.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <string>

namespace syncmd::protocol {

Result<void> EnvelopeChannel::send(const Envelope& envelope) {
    auto payload = encode_envelope(envelope);
    if (payload.is_error()) {
        return Err<void>(payload.error());
    }
    const auto frame = frame_payload(payload.value());
    spdlog::trace("-> {} ({} bytes)", envelope_type(envelope), frame.size());
    return stream_.write_all(frame.data(), frame.size());
}

Result<Envelope> EnvelopeChannel::receive() {
    std::array<std::uint8_t, 4> header{};
    if (auto res = stream_.read_exact(header.data(), header.size()); res.is_error()) {
        return Err<Envelope>(res.error());
    }

    const auto length = read_frame_length(header.data());
    if (length == 0 || length > kMaxFrameSize) {
        return Err<Envelope>(ErrorKind::Serialization,
                             "Invalid frame length: " + std::to_string(length));
    }

    std::string payload(length, '\0');
    if (auto res = stream_.read_exact(reinterpret_cast<std::uint8_t*>(payload.data()), payload.size());
        res.is_error()) {
        return Err<Envelope>(res.error());
    }

    auto envelope = decode_envelope(payload);
    if (envelope.is_ok()) {
        spdlog::trace("<- {} ({} bytes)", envelope_type(envelope.value()), length);
    }
    return envelope;
}

} // namespace syncmd::protocol
