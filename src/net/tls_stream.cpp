#include "pgwire/net/tls_stream.hpp"

#include <arpa/inet.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <utility>

#include "pgwire/error.hpp"
#include "pgwire/util/logger.hpp"

namespace pgwire::net {

namespace {

void ssl_global_init() {
    static bool done = [] {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                         nullptr);
        return true;
    }();
    (void)done;
}

// drains the OpenSSL error queue into one message
std::string ssl_error_string(const std::string& what) {
    std::string message = what;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        char buf[256]{};
        ERR_error_string_n(code, buf, sizeof(buf));
        message += ": ";
        message += buf;
    }
    return message;
}

bool is_ip_address(const std::string& host) {
    unsigned char buf[sizeof(in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 || inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

// chunk size for a single SSL_read/SSL_write call, which take an int
constexpr std::size_t kMaxChunk = INT_MAX;

}  // namespace

// TlsContext ------------------------------------------------------------------------

TlsContext TlsContext::client(const TlsOptions& options) {
    ssl_global_init();

    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (ctx == nullptr) {
        throw TlsHandshakeError(ssl_error_string("failed to create TLS context"));
    }
    TlsContext context(ctx);

    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

    if (options.verify_peer) {
        if (!options.ca_file.empty()) {
            if (SSL_CTX_load_verify_locations(ctx, options.ca_file.c_str(), nullptr) != 1) {
                throw TlsHandshakeError(
                    ssl_error_string("failed to load CA file " + options.ca_file));
            }
        } else if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
            throw TlsHandshakeError(ssl_error_string("failed to load default CA paths"));
        }
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    }

    return context;
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(ctx_);
    }
}

TlsContext::TlsContext(TlsContext&& other) noexcept : ctx_(std::exchange(other.ctx_, nullptr)) {}

TlsContext& TlsContext::operator=(TlsContext&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            SSL_CTX_free(ctx_);
        }
        ctx_ = std::exchange(other.ctx_, nullptr);
    }
    return *this;
}

// TlsStream -------------------------------------------------------------------------

TlsStream::TlsStream(const TlsContext& context, std::unique_ptr<SocketStream> socket,
                     const std::string& host)
    : socket_(std::move(socket)) {
    ssl_ = SSL_new(context.native());
    if (ssl_ == nullptr) {
        throw TlsHandshakeError(ssl_error_string("failed to create TLS session"));
    }

    if (SSL_set_fd(ssl_, socket_->fd()) != 1) {
        SSL_free(ssl_);
        throw TlsHandshakeError(ssl_error_string("failed to attach socket to TLS session"));
    }

    // SNI and certificate name checks. IP literals are matched against IP SANs
    X509_VERIFY_PARAM* param = SSL_get0_param(ssl_);
    if (is_ip_address(host)) {
        X509_VERIFY_PARAM_set1_ip_asc(param, host.c_str());
    } else {
        SSL_set_tlsext_host_name(ssl_, host.c_str());
        X509_VERIFY_PARAM_set1_host(param, host.c_str(), host.size());
    }

    int ret = SSL_connect(ssl_);
    if (ret != 1) {
        std::string message = ssl_error_string("TLS handshake with " + host + " failed");
        long verify = SSL_get_verify_result(ssl_);
        if (verify != X509_V_OK) {
            message += ": ";
            message += X509_verify_cert_error_string(verify);
        }
        SSL_free(ssl_);
        throw TlsHandshakeError(message);
    }

    LOG_DEBUG(std::string("TLS established: ") + SSL_get_version(ssl_) + " " +
              SSL_get_cipher_name(ssl_));
}

TlsStream::~TlsStream() {
    // close_notify so the server sees an orderly end, not a truncated stream.
    // not allowed after a fatal error; the result does not matter either way
    if (!failed_) {
        SSL_shutdown(ssl_);
    }
    ERR_clear_error();
    SSL_free(ssl_);
}

void TlsStream::read_exact(uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        int chunk = static_cast<int>(std::min(len - total, kMaxChunk));
        errno = 0;
        int n = SSL_read(ssl_, data + total, chunk);
        if (n > 0) {
            total += static_cast<std::size_t>(n);
            continue;
        }
        fail(SSL_get_error(ssl_, n), errno, "read");
    }
}

void TlsStream::write_all(const uint8_t* data, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        int chunk = static_cast<int>(std::min(len - total, kMaxChunk));
        errno = 0;
        int n = SSL_write(ssl_, data + total, chunk);
        if (n > 0) {
            total += static_cast<std::size_t>(n);
            continue;
        }
        fail(SSL_get_error(ssl_, n), errno, "write");
    }
}

/*
    maps a failed SSL_read/SSL_write to an exception:
      WANT_READ/WANT_WRITE      -> the socket deadline expired (blocking socket with SO_RCVTIMEO)
      ZERO_RETURN               -> peer sent close_notify
      SYSCALL, empty queue      -> socket error or EOF without close_notify
      SSL, unexpected EOF       -> same, as OpenSSL 3 reports it
      anything else             -> TLS protocol failure
*/
void TlsStream::fail(int ssl_error, int sys_errno, const char* op) {
    failed_ = true;

    if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE ||
        (ssl_error == SSL_ERROR_SYSCALL && (sys_errno == EAGAIN || sys_errno == EWOULDBLOCK))) {
        ERR_clear_error();
        throw IoError(std::string(op) + " timed out");
    }
    if (ssl_error == SSL_ERROR_ZERO_RETURN) {
        throw IoError("connection closed by peer");
    }
    if (ssl_error == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
        throw IoError(std::string("connection lost during TLS ") + op);
    }
    if (ssl_error == SSL_ERROR_SSL &&
        ERR_GET_REASON(ERR_peek_error()) == SSL_R_UNEXPECTED_EOF_WHILE_READING) {
        ERR_clear_error();
        throw IoError(std::string("connection lost during TLS ") + op);
    }
    throw TlsError(ssl_error_string(std::string("TLS ") + op + " failed"));
}

}  // namespace pgwire::net
