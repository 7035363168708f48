#include "pgwire/net/client/session.hpp"

#include <utility>
#include <variant>

#include "pgwire/error.hpp"
#include "pgwire/net/client/protocol_handler.hpp"
#include "pgwire/net/wire_protocol.hpp"
#include "pgwire/util/logger.hpp"

namespace pgwire::net::client {

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::AwaitingSslAck:
            return "AwaitingSslAck";
        case SessionState::AwaitingAuth:
            return "AwaitingAuth";
        case SessionState::AwaitingBackendKeyOrParams:
            return "AwaitingBackendKeyOrParams";
        case SessionState::ReadyIdle:
            return "ReadyIdle";
        case SessionState::QuerySent:
            return "QuerySent";
        case SessionState::Terminated:
            return "Terminated";
        case SessionState::Failed:
            return "Failed";
    }
    return "?";
}

Session::Session(SessionOptions options, std::unique_ptr<SocketStream> socket, TlsUpgrade upgrade)
    : options_(std::move(options)), socket_(std::move(socket)), upgrade_(std::move(upgrade)) {}

void Session::run() {
    if (state_ != SessionState::AwaitingSslAck) {
        throw ProtocolError("session already ran, state " + std::string(to_string(state_)));
    }

    try {
        negotiate_ssl();

        write_message(*stream_, StartupMessage{options_.user, options_.database});
        state_ = SessionState::AwaitingAuth;

        while (!handle(read_message(*stream_))) {
        }
    } catch (...) {
        state_ = SessionState::Failed;
        throw;
    }
}

void Session::negotiate_ssl() {
    write_message(*socket_, RequestSsl{});

    uint8_t answer = read_byte(*socket_);
    if (answer != kSslAccepted) {
        throw ProtocolError("server refused TLS, answered byte " +
                            std::to_string(static_cast<int>(answer)));
    }

    // the upgrade consumes the plaintext socket
    stream_ = upgrade_(std::move(socket_));
    if (!stream_) {
        throw TlsHandshakeError("TLS upgrade produced no stream");
    }
}

bool Session::handle(const BackendMessage& message) {
    if (std::holds_alternative<AuthenticationCleartextPassword>(message)) {
        write_message(*stream_, PasswordMessage{options_.password});
        return false;
    }

    if (const auto* ready = std::get_if<ReadyForQuery>(&message)) {
        // transaction states are inert for a single simple query
        if (ready->status != ReadyForQueryStatus::Idle) {
            return false;
        }
        if (!query_sent_) {
            state_ = SessionState::ReadyIdle;
            write_message(*stream_, SimpleQuery{options_.query});
            query_sent_ = true;
            state_ = SessionState::QuerySent;
            return false;
        }
        state_ = SessionState::Terminated;
        return true;
    }

    if (std::holds_alternative<AuthenticationOk>(message)) {
        if (state_ == SessionState::AwaitingAuth) {
            state_ = SessionState::AwaitingBackendKeyOrParams;
        }
    } else if (const auto* key = std::get_if<BackendKeyData>(&message)) {
        backend_key_ = *key;
    } else if (const auto* param = std::get_if<ParameterStatus>(&message)) {
        parameters_[param->name] = param->value;
    } else if (const auto* error = std::get_if<ErrorResponse>(&message)) {
        last_error_ = *error;
        LOG_WARN("server error: " + error->field(ErrorFieldKind::Message).value_or("(no message)"));
    } else if (std::holds_alternative<AuthenticationSasl>(message)) {
        LOG_WARN("server asked for SASL authentication, which this client does not perform");
    }
    return false;
}

}  // namespace pgwire::net::client
