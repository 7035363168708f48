#ifndef PGWIRE_ERROR_HPP
#define PGWIRE_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace pgwire {

// where a failure came from. the top level renders one message per kind
enum class ErrorKind {
    Io,
    Parse,
    TlsHandshake,
    Tls,
    Config,
    Protocol,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind);

class Error : public std::runtime_error {
   public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept {
        return kind_;
    }

   private:
    ErrorKind kind_;
};

// stream read/write/connect failures, including a peer closing mid-frame
class IoError : public Error {
   public:
    explicit IoError(const std::string& message) : Error(ErrorKind::Io, message) {}
};

// bytes arrived but do not form a valid message
class ParseError : public Error {
   public:
    explicit ParseError(const std::string& message) : Error(ErrorKind::Parse, message) {}
};

class TlsHandshakeError : public Error {
   public:
    explicit TlsHandshakeError(const std::string& message)
        : Error(ErrorKind::TlsHandshake, message) {}
};

class TlsError : public Error {
   public:
    explicit TlsError(const std::string& message) : Error(ErrorKind::Tls, message) {}
};

class ConfigError : public Error {
   public:
    explicit ConfigError(const std::string& message) : Error(ErrorKind::Config, message) {}
};

// server answered with something the handshake does not allow
class ProtocolError : public Error {
   public:
    explicit ProtocolError(const std::string& message) : Error(ErrorKind::Protocol, message) {}
};

}  // namespace pgwire

#endif
