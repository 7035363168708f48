#ifndef PGWIRE_NET_CLIENT_PROTOCOL_HANDLER_HPP
#define PGWIRE_NET_CLIENT_PROTOCOL_HANDLER_HPP

#include <cstdint>

#include "pgwire/net/messages.hpp"
#include "pgwire/net/stream.hpp"

namespace pgwire::net::client {

// logs "--> message", then encodes and writes it. throws IoError/TlsError
void write_message(IStream& stream, const FrontendMessage& message);

// reads exactly one frame (tag, length, length - 4 payload bytes), decodes it and logs
// "<-- message". short reads throw IoError, malformed frames ParseError
[[nodiscard]] BackendMessage read_message(IStream& stream);

// one raw byte outside any framing, as the server answers a RequestSsl
[[nodiscard]] uint8_t read_byte(IStream& stream);

}  // namespace pgwire::net::client

#endif
