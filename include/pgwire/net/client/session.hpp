#ifndef PGWIRE_NET_CLIENT_SESSION_HPP
#define PGWIRE_NET_CLIENT_SESSION_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "pgwire/net/messages.hpp"
#include "pgwire/net/stream.hpp"

namespace pgwire::net::client {

enum class SessionState {
    AwaitingSslAck,
    AwaitingAuth,
    AwaitingBackendKeyOrParams,
    ReadyIdle,   // first idle ReadyForQuery seen, query going out
    QuerySent,
    Terminated,  // second idle ReadyForQuery seen
    Failed,
};

[[nodiscard]] std::string_view to_string(SessionState state);

struct SessionOptions {
    std::string user;
    std::string database;
    std::string password;
    std::string query = "SELECT * FROM my_table LIMIT 3;";
};

// takes the plaintext socket once the server accepted TLS and returns the encrypted stream.
// throws TlsHandshakeError on failure
using TlsUpgrade = std::function<std::unique_ptr<IStream>(std::unique_ptr<SocketStream>)>;

/*
    login + single query state machine over one connection.

    RequestSsl -> 'S' -> upgrade -> StartupMessage, then per backend message:
      AuthenticationCleartextPassword -> PasswordMessage
      ReadyForQuery(Idle), query not sent -> SimpleQuery
      ReadyForQuery(Idle), query sent     -> done
      anything else                      -> keep reading
*/
class Session {
   public:
    Session(SessionOptions options, std::unique_ptr<SocketStream> socket, TlsUpgrade upgrade);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // runs until the post-query idle state. throws pgwire::Error, leaving the state Failed
    void run();

    [[nodiscard]] SessionState state() const noexcept {
        return state_;
    }
    [[nodiscard]] bool query_sent() const noexcept {
        return query_sent_;
    }

    // observations only; none of these drive the state machine
    [[nodiscard]] const std::map<std::string, std::string>& parameters() const noexcept {
        return parameters_;
    }
    [[nodiscard]] const std::optional<BackendKeyData>& backend_key() const noexcept {
        return backend_key_;
    }
    [[nodiscard]] const std::optional<ErrorResponse>& last_error() const noexcept {
        return last_error_;
    }

   private:
    void negotiate_ssl();
    // returns true once the session is finished
    bool handle(const BackendMessage& message);

    SessionOptions options_;
    std::unique_ptr<SocketStream> socket_;
    std::unique_ptr<IStream> stream_;
    TlsUpgrade upgrade_;

    SessionState state_ = SessionState::AwaitingSslAck;
    bool query_sent_ = false;

    std::map<std::string, std::string> parameters_;
    std::optional<BackendKeyData> backend_key_;
    std::optional<ErrorResponse> last_error_;
};

}  // namespace pgwire::net::client

#endif
