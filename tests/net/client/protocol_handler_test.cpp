#include "pgwire/net/client/protocol_handler.hpp"

#include <gtest/gtest.h>

#include <variant>

#include "../test_support.hpp"
#include "pgwire/error.hpp"
#include "pgwire/net/wire_protocol.hpp"

namespace pgwire::net::client::test {

using namespace pgwire::net::test;

class ProtocolHandlerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto [client, server] = make_socket_pair();
        client_ = std::move(client);
        server_ = std::move(server);
    }

    std::unique_ptr<SocketStream> client_;
    std::unique_ptr<SocketStream> server_;
};

TEST_F(ProtocolHandlerTest, WriteMessageSendsEncodedFrame) {
    write_message(*client_, SimpleQuery{"SELECT 1;"});

    auto [tag, payload] = read_tagged(*server_);
    EXPECT_EQ(tag, 'Q');
    EXPECT_EQ(payload, bytes("SELECT 1;\0"));
}

TEST_F(ProtocolHandlerTest, WriteStartupIsUntagged) {
    write_message(*client_, StartupMessage{"alice", "inventory"});

    EXPECT_EQ(read_untagged(*server_), WireProtocol::encode(StartupMessage{"alice", "inventory"}));
}

TEST_F(ProtocolHandlerTest, ReadMessageConsumesOneFrame) {
    send_bytes(*server_, concat({frame('R', auth_payload(3)), frame('Z', bytes("I"))}));

    auto first = read_message(*client_);
    auto second = read_message(*client_);

    EXPECT_TRUE(std::holds_alternative<AuthenticationCleartextPassword>(first));
    ASSERT_TRUE(std::holds_alternative<ReadyForQuery>(second));
    EXPECT_EQ(std::get<ReadyForQuery>(second).status, ReadyForQueryStatus::Idle);
}

TEST_F(ProtocolHandlerTest, ReadMessageMatchesBufferDecode) {
    auto data = frame('S', bytes("TimeZone\0UTC\0"));
    send_bytes(*server_, data);

    std::size_t consumed = 0;
    auto buffered = WireProtocol::decode(data, consumed);
    ASSERT_TRUE(buffered.has_value());

    auto message = read_message(*client_);
    EXPECT_EQ(describe(message), describe(*buffered));
    ASSERT_TRUE(std::holds_alternative<ParameterStatus>(message));
    EXPECT_EQ(std::get<ParameterStatus>(message).value, "UTC");
}

TEST_F(ProtocolHandlerTest, ReadMessageEmptyPayload) {
    send_bytes(*server_, frame('I', {}));

    auto message = read_message(*client_);
    ASSERT_TRUE(std::holds_alternative<UnknownMessage>(message));
    EXPECT_EQ(std::get<UnknownMessage>(message).prefix, 'I');
    EXPECT_TRUE(std::get<UnknownMessage>(message).payload.empty());
}

TEST_F(ProtocolHandlerTest, ShortPayloadIsIoError) {
    // header promises 8 payload bytes, only 2 arrive
    send_bytes(*server_, Bytes{'K', 0x00, 0x00, 0x00, 0x0C, 0x00, 0x01});
    server_->close();

    EXPECT_THROW((void)read_message(*client_), IoError);
}

TEST_F(ProtocolHandlerTest, LengthBelowHeaderIsParseError) {
    send_bytes(*server_, Bytes{'Z', 0x00, 0x00, 0x00, 0x03});

    EXPECT_THROW((void)read_message(*client_), ParseError);
}

TEST_F(ProtocolHandlerTest, MalformedPayloadIsParseError) {
    send_bytes(*server_, frame('Z', bytes("Q")));

    EXPECT_THROW((void)read_message(*client_), ParseError);
}

TEST_F(ProtocolHandlerTest, ReadByte) {
    send_bytes(*server_, bytes("SN"));

    EXPECT_EQ(read_byte(*client_), 'S');
    EXPECT_EQ(read_byte(*client_), 'N');
}

}  // namespace pgwire::net::client::test
