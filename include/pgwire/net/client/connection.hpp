#ifndef PGWIRE_NET_CLIENT_CONNECTION_HPP
#define PGWIRE_NET_CLIENT_CONNECTION_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "pgwire/net/client/session.hpp"
#include "pgwire/net/tls_stream.hpp"
#include "pgwire/util/config.hpp"

namespace pgwire::net::client {

struct ConnectionOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 5432;
    int timeout_seconds = 0;
    SessionOptions session;
    TlsOptions tls;

    static ConnectionOptions from_config(const util::Config& config);
};

// one TCP connection to the server, upgraded to TLS, running a single Session
class Connection {
   public:
    explicit Connection(const ConnectionOptions& options);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) noexcept;
    Connection& operator=(Connection&&) noexcept;

    // connect, log in and run the query. throws pgwire::Error
    void run();

    [[nodiscard]] SessionState state() const noexcept;
    [[nodiscard]] std::map<std::string, std::string> parameters() const;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pgwire::net::client

#endif
