#include "pgwire/error.hpp"

namespace pgwire {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io:
            return "IoError";
        case ErrorKind::Parse:
            return "ParseMessageError";
        case ErrorKind::TlsHandshake:
            return "TlsHandshakeError";
        case ErrorKind::Tls:
            return "TlsError";
        case ErrorKind::Config:
            return "ConfigError";
        case ErrorKind::Protocol:
            return "ProtocolError";
    }
    return "UnknownError";
}

}  // namespace pgwire
