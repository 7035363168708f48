#include "pgwire/net/stream.hpp"

#include <gtest/gtest.h>

#include <thread>

#include "pgwire/error.hpp"
#include "test_support.hpp"

namespace pgwire::net::test {

TEST(SocketStreamTest, ReadExactAcrossWrites) {
    auto [client, server] = make_socket_pair();

    send_bytes(*server, bytes("Z\0\0"));
    send_bytes(*server, bytes("\0\x05I"));

    uint8_t buf[6];
    client->read_exact(buf, sizeof(buf));
    EXPECT_EQ(buf[0], 'Z');
    EXPECT_EQ(buf[4], 0x05);
    EXPECT_EQ(buf[5], 'I');
}

TEST(SocketStreamTest, WriteAll) {
    auto [client, server] = make_socket_pair();

    Bytes data(64 * 1024, 0xAB);
    std::thread writer([&, c = client.get()] { c->write_all(data.data(), data.size()); });

    Bytes received(data.size());
    server->read_exact(received.data(), received.size());
    writer.join();

    EXPECT_EQ(received, data);
}

TEST(SocketStreamTest, PeerCloseIsIoError) {
    auto [client, server] = make_socket_pair();

    send_bytes(*server, bytes("R\0"));
    server->close();

    uint8_t buf[5];
    EXPECT_THROW(client->read_exact(buf, sizeof(buf)), IoError);
}

TEST(SocketStreamTest, WriteToClosedPeerIsIoError) {
    auto [client, server] = make_socket_pair();
    server->close();

    Bytes data(16, 0x00);
    EXPECT_THROW(client->write_all(data.data(), data.size()), IoError);
}

TEST(SocketStreamTest, ClosedStreamRejectsIo) {
    auto [client, server] = make_socket_pair();
    client->close();

    uint8_t byte = 0;
    EXPECT_EQ(client->fd(), -1);
    EXPECT_THROW(client->read_exact(&byte, 1), IoError);
    EXPECT_THROW(client->write_all(&byte, 1), IoError);
}

TEST(SocketStreamTest, MoveTransfersOwnership) {
    auto [client, server] = make_socket_pair();
    int fd = client->fd();

    SocketStream moved(std::move(*client));
    EXPECT_EQ(moved.fd(), fd);
    EXPECT_EQ(client->fd(), -1);
}

TEST(SocketStreamTest, ConnectLoopback) {
    Listener listener;
    std::unique_ptr<SocketStream> accepted;
    std::thread acceptor([&] { accepted = listener.accept_one(); });

    auto stream = SocketStream::connect("127.0.0.1", listener.port());
    acceptor.join();
    ASSERT_NE(stream, nullptr);

    send_bytes(*accepted, bytes("S"));
    uint8_t byte = 0;
    stream->read_exact(&byte, 1);
    EXPECT_EQ(byte, 'S');
}

TEST(SocketStreamTest, ConnectRefusedIsIoError) {
    uint16_t port = 0;
    {
        Listener listener;
        port = listener.port();
    }

    EXPECT_THROW(SocketStream::connect("127.0.0.1", port), IoError);
}

TEST(SocketStreamTest, UnresolvableHostIsIoError) {
    EXPECT_THROW(SocketStream::connect("no-such-host.invalid", 5432), IoError);
}

TEST(SocketStreamTest, ReadTimeout) {
    Listener listener;
    std::unique_ptr<SocketStream> accepted;
    std::thread acceptor([&] { accepted = listener.accept_one(); });

    auto stream = SocketStream::connect("127.0.0.1", listener.port(), 1);
    acceptor.join();

    // server never answers
    uint8_t byte = 0;
    try {
        stream->read_exact(&byte, 1);
        FAIL() << "expected a timeout";
    } catch (const IoError& e) {
        EXPECT_STREQ(e.what(), "read timed out");
    }
}

}  // namespace pgwire::net::test
