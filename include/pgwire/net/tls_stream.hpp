#ifndef PGWIRE_NET_TLS_STREAM_HPP
#define PGWIRE_NET_TLS_STREAM_HPP

#include <openssl/ssl.h>

#include <memory>
#include <string>

#include "pgwire/net/stream.hpp"

namespace pgwire::net {

struct TlsOptions {
    bool verify_peer = true;
    std::string ca_file;  // empty = system default trust store
};

// RAII wrapper over SSL_CTX, client side only
class TlsContext {
   public:
    // throws TlsHandshakeError if the context or trust store cannot be set up
    static TlsContext client(const TlsOptions& options = {});

    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;
    TlsContext(TlsContext&& other) noexcept;
    TlsContext& operator=(TlsContext&& other) noexcept;

    [[nodiscard]] SSL_CTX* native() const noexcept {
        return ctx_;
    }

   private:
    explicit TlsContext(SSL_CTX* ctx) noexcept : ctx_(ctx) {}

    SSL_CTX* ctx_ = nullptr;
};

/*
    TLS over an already connected socket, upgraded in place.
    the handshake runs in the constructor; a failed handshake throws TlsHandshakeError.
    after that, TLS-level failures throw TlsError. a peer close or an expired socket deadline
    throws IoError, as on a plain socket.
*/
class TlsStream : public IStream {
   public:
    TlsStream(const TlsContext& context, std::unique_ptr<SocketStream> socket,
              const std::string& host);
    ~TlsStream() override;

    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    void read_exact(uint8_t* data, std::size_t len) override;
    void write_all(const uint8_t* data, std::size_t len) override;

   private:
    // always throws; marks the session unusable for a clean shutdown
    [[noreturn]] void fail(int ssl_error, int sys_errno, const char* op);

    std::unique_ptr<SocketStream> socket_;
    SSL* ssl_ = nullptr;
    bool failed_ = false;
};

}  // namespace pgwire::net

#endif
