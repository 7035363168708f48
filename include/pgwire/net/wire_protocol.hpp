#ifndef PGWIRE_NET_WIRE_PROTOCOL_HPP
#define PGWIRE_NET_WIRE_PROTOCOL_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "pgwire/net/messages.hpp"

namespace pgwire::net {

// the length field counts itself
constexpr uint32_t kLengthFieldSize = 4;

constexpr uint16_t kSslRequestCodeHigh = 1234;
constexpr uint16_t kSslRequestCodeLow = 5679;
constexpr uint16_t kProtocolVersionMajor = 3;
constexpr uint16_t kProtocolVersionMinor = 0;

// single byte the server answers a RequestSsl with when it accepts TLS
constexpr uint8_t kSslAccepted = 'S';

class WireProtocol {
   public:
    // encode a frontend message to bytes. never fails
    static std::vector<uint8_t> encode(const FrontendMessage& message);

    // decode one backend frame from its parts. payload must hold exactly length - 4 bytes.
    // throws ParseError on malformed content
    static BackendMessage decode(char tag, uint32_t length, const std::vector<uint8_t>& payload);

    // decode the first frame in a buffer (returns nullopt if incomplete). read_message frames
    // every backend message through this
    static std::optional<BackendMessage> decode(const std::vector<uint8_t>& data,
                                                std::size_t& bytes_consumed);

    // helper: get the length field of a tagged frame (0 if not buffered yet)
    static uint32_t peek_message_length(const std::vector<uint8_t>& data);
};

}  // namespace pgwire::net

#endif
