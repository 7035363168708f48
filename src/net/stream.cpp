#include "pgwire/net/stream.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "pgwire/error.hpp"
#include "pgwire/util/logger.hpp"

namespace pgwire::net {

namespace {

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

void set_timeout(int fd, int timeout_seconds) {
    struct timeval tv;
    tv.tv_sec = timeout_seconds;
    tv.tv_usec = 0;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw IoError(errno_message("failed to set socket timeout"));
    }
}

// owns a getaddrinfo result list
struct AddrInfoList {
    addrinfo* head = nullptr;
    ~AddrInfoList() {
        if (head) {
            freeaddrinfo(head);
        }
    }
};

}  // namespace

SocketStream::SocketStream(int fd) : fd_(fd) {}

SocketStream::~SocketStream() {
    close();
}

SocketStream::SocketStream(SocketStream&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

SocketStream& SocketStream::operator=(SocketStream&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

std::unique_ptr<SocketStream> SocketStream::connect(const std::string& host, uint16_t port,
                                                    int timeout_seconds) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    AddrInfoList results;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results.head);
    if (rc != 0) {
        throw IoError("failed to resolve " + host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no addresses for " + host;
    // try each resolved address until one connects
    for (addrinfo* ai = results.head; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno_message("failed to create socket");
            continue;
        }

        auto stream = std::make_unique<SocketStream>(fd);
        if (timeout_seconds > 0) {
            set_timeout(fd, timeout_seconds);
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            LOG_DEBUG("connected to " + host + ":" + service);
            return stream;
        }
        last_error = errno_message("failed to connect to " + host + ":" + service);
    }

    throw IoError(last_error);
}

void SocketStream::read_exact(uint8_t* data, std::size_t len) {
    if (fd_ < 0) {
        throw IoError("read on closed socket");
    }

    std::size_t total = 0;
    while (total < len) {
        ssize_t n = recv(fd_, data + total, len - total, 0);
        if (n == 0) {
            throw IoError("connection closed by peer");
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw IoError("read timed out");
            }
            throw IoError(errno_message("read failed"));
        }
        total += static_cast<std::size_t>(n);
    }
}

void SocketStream::write_all(const uint8_t* data, std::size_t len) {
    if (fd_ < 0) {
        throw IoError("write on closed socket");
    }

    // MSG_NOSIGNAL: a closed peer gives EPIPE instead of killing the process with SIGPIPE
    std::size_t total = 0;
    while (total < len) {
        ssize_t sent = send(fd_, data + total, len - total, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw IoError("write timed out");
            }
            throw IoError(errno_message("write failed"));
        }
        total += static_cast<std::size_t>(sent);
    }
}

void SocketStream::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace pgwire::net
