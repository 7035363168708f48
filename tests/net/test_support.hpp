#ifndef PGWIRE_TESTS_NET_TEST_SUPPORT_HPP
#define PGWIRE_TESTS_NET_TEST_SUPPORT_HPP

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "pgwire/net/stream.hpp"
#include "pgwire/util/binary_io.hpp"

namespace pgwire::net::test {

using Bytes = std::vector<uint8_t>;

// bytes of a string literal without its implicit terminator, so "a\0b" is 3 bytes
template <std::size_t N>
Bytes bytes(const char (&s)[N]) {
    return Bytes(s, s + N - 1);
}

inline Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes result;
    for (const auto& part : parts) {
        result.insert(result.end(), part.begin(), part.end());
    }
    return result;
}

// a backend frame the way a server would send it
inline Bytes frame(char tag, const Bytes& payload) {
    Bytes result;
    result.push_back(static_cast<uint8_t>(tag));
    util::write_uint32_be(result, static_cast<uint32_t>(payload.size() + 4));
    result.insert(result.end(), payload.begin(), payload.end());
    return result;
}

inline Bytes auth_payload(uint32_t code) {
    Bytes payload;
    util::write_uint32_be(payload, code);
    return payload;
}

// connected pair of local sockets: {client end, server end}
inline std::pair<std::unique_ptr<SocketStream>, std::unique_ptr<SocketStream>> make_socket_pair() {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        throw std::runtime_error("socketpair failed");
    }
    return {std::make_unique<SocketStream>(fds[0]), std::make_unique<SocketStream>(fds[1])};
}

inline void send_bytes(SocketStream& stream, const Bytes& data) {
    stream.write_all(data.data(), data.size());
}

// reads one untagged startup-phase frame, returns it whole (length included)
inline Bytes read_untagged(SocketStream& stream) {
    Bytes header(4);
    stream.read_exact(header.data(), header.size());
    uint32_t length = util::read_uint32_be(header.data());
    Bytes result = header;
    result.resize(length);
    stream.read_exact(result.data() + 4, length - 4);
    return result;
}

// reads one tagged frontend frame: {tag, payload}
inline std::pair<char, Bytes> read_tagged(SocketStream& stream) {
    uint8_t header[5];
    stream.read_exact(header, sizeof(header));
    uint32_t length = util::read_uint32_be(header + 1);
    Bytes payload(length - 4);
    if (!payload.empty()) {
        stream.read_exact(payload.data(), payload.size());
    }
    return {static_cast<char>(header[0]), payload};
}

// listening socket on 127.0.0.1 with a kernel-chosen port
class Listener {
   public:
    Listener() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            throw std::runtime_error("socket failed");
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || listen(fd_, 4) < 0) {
            ::close(fd_);
            throw std::runtime_error("bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~Listener() {
        close();
    }

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    // blocks until a client connects
    std::unique_ptr<SocketStream> accept_one() {
        int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) {
            throw std::runtime_error("accept failed");
        }
        return std::make_unique<SocketStream>(client);
    }

    uint16_t port() const {
        return port_;
    }

   private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

}  // namespace pgwire::net::test

#endif
