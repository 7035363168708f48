#include "pgwire/net/client/connection.hpp"

#include <csignal>
#include <utility>

#include "pgwire/util/logger.hpp"

namespace pgwire::net::client {

namespace {

/*
    SSL_write goes through plain write(2) on the socket, which raises SIGPIPE when the
    server has already hung up. ignore it so the failure surfaces as an error instead.
*/
struct SigpipeIgnorer {
    SigpipeIgnorer() {
        std::signal(SIGPIPE, SIG_IGN);
    }
};

}  // namespace

ConnectionOptions ConnectionOptions::from_config(const util::Config& config) {
    ConnectionOptions options;
    options.host = config.host;
    options.port = config.port;
    options.timeout_seconds = config.timeout_seconds;
    options.session.user = config.user;
    options.session.database = config.database;
    options.session.password = config.password;
    options.session.query = config.query;
    options.tls.verify_peer = config.ssl_verify;
    options.tls.ca_file = config.ssl_ca_file;
    return options;
}

class Connection::Impl {
   public:
    explicit Impl(const ConnectionOptions& options) : options_(options) {}

    void run() {
        static SigpipeIgnorer sigpipe_ignorer;

        context_ = std::make_unique<TlsContext>(TlsContext::client(options_.tls));

        LOG_INFO("connecting to " + options_.host + ":" + std::to_string(options_.port));
        auto socket = SocketStream::connect(options_.host, options_.port, options_.timeout_seconds);

        const TlsContext& context = *context_;
        const std::string host = options_.host;
        auto upgrade = [&context, host](std::unique_ptr<SocketStream> plain) -> std::unique_ptr<IStream> {
            return std::make_unique<TlsStream>(context, std::move(plain), host);
        };

        session_ = std::make_unique<Session>(options_.session, std::move(socket), upgrade);
        session_->run();
        LOG_INFO("session finished");
    }

    [[nodiscard]] SessionState state() const noexcept {
        return session_ ? session_->state() : SessionState::AwaitingSslAck;
    }

    [[nodiscard]] std::map<std::string, std::string> parameters() const {
        return session_ ? session_->parameters() : std::map<std::string, std::string>{};
    }

   private:
    ConnectionOptions options_;
    // must outlive session_, whose TLS stream holds an SSL from it
    std::unique_ptr<TlsContext> context_;
    std::unique_ptr<Session> session_;
};

// PIMPL INTERFACE ------------------------------------------------------------------------
Connection::Connection(const ConnectionOptions& options)
    : impl_(std::make_unique<Impl>(options)) {}
Connection::~Connection() = default;
Connection::Connection(Connection&&) noexcept = default;
Connection& Connection::operator=(Connection&&) noexcept = default;
void Connection::run() {
    impl_->run();
}
SessionState Connection::state() const noexcept {
    return impl_->state();
}
std::map<std::string, std::string> Connection::parameters() const {
    return impl_->parameters();
}

}  // namespace pgwire::net::client
