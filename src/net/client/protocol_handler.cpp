#include "pgwire/net/client/protocol_handler.hpp"

#include <string>
#include <utility>
#include <vector>

#include "pgwire/error.hpp"
#include "pgwire/net/wire_protocol.hpp"
#include "pgwire/util/logger.hpp"

namespace pgwire::net::client {

void write_message(IStream& stream, const FrontendMessage& message) {
    LOG_INFO("--> " + describe(message));
    auto data = WireProtocol::encode(message);
    stream.write_all(data.data(), data.size());
}

BackendMessage read_message(IStream& stream) {
    std::vector<uint8_t> frame(1 + kLengthFieldSize);
    stream.read_exact(frame.data(), frame.size());

    uint32_t length = WireProtocol::peek_message_length(frame);
    if (length < kLengthFieldSize) {
        throw ParseError("length field " + std::to_string(length) + " is below the header size");
    }

    // grow to the whole frame, then read the payload into place
    std::size_t header_size = frame.size();
    frame.resize(1 + static_cast<std::size_t>(length));
    if (frame.size() > header_size) {
        stream.read_exact(frame.data() + header_size, frame.size() - header_size);
    }

    if (util::Logger::instance().enabled(util::LogLevel::Debug)) {
        LOG_DEBUG("frame '" + std::string(1, static_cast<char>(frame[0])) + "' length " +
                  std::to_string(length));
    }

    std::size_t bytes_consumed = 0;
    auto message = WireProtocol::decode(frame, bytes_consumed);
    if (!message || bytes_consumed != frame.size()) {
        throw ParseError("frame of length " + std::to_string(length) + " did not decode whole");
    }
    LOG_INFO("<-- " + describe(*message));
    return std::move(*message);
}

uint8_t read_byte(IStream& stream) {
    uint8_t byte = 0;
    stream.read_exact(&byte, 1);
    return byte;
}

}  // namespace pgwire::net::client
