#include "lexsync/network/tcp_transport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace lexsync;
using namespace lexsync::network;

namespace {

struct Endpoint {
    std::optional<std::string> id;
    std::shared_ptr<Channel> channel;
    std::optional<Error> error;
    std::vector<std::vector<std::uint8_t>> received;
    bool closed = false;

    TransportHandlers transport_handlers() {
        return TransportHandlers{
            [this](std::string local) { id = std::move(local); },
            [this](std::shared_ptr<Channel> c) {
                channel = std::move(c);
                channel->start(ChannelHandlers{
                    nullptr,
                    [this](std::vector<std::uint8_t> frame) { received.push_back(std::move(frame)); },
                    [this] { closed = true; },
                    [this](const Error& e) { error = e; },
                });
            },
            [this](const Error& e) { error = e; },
        };
    }
};

template <typename Pred>
bool run_until(boost::asio::io_context& io, Pred done) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        io.run_for(std::chrono::milliseconds(10));
        io.restart();
    }
    return done();
}

TcpTransportOptions loopback_options(std::size_t max_message_bytes = 1024) {
    TcpTransportOptions options;
    options.listen_address = "127.0.0.1";
    options.listen_port = 0;
    options.advertise_host = "127.0.0.1";
    options.max_message_bytes = max_message_bytes;
    return options;
}

} // namespace

TEST(TcpFramingTest, HeaderIsBigEndianLength) {
    const auto header = TcpChannel::encode_header(0x01020304);
    EXPECT_EQ(header, (std::vector<std::uint8_t>{0x01, 0x02, 0x03, 0x04}));
    EXPECT_EQ(TcpChannel::decode_header({0x01, 0x02, 0x03, 0x04}), 0x01020304u);
    EXPECT_EQ(TcpChannel::decode_header({0, 0, 0, 0}), 0u);
}

TEST(TcpFramingTest, ParsesEndpoints) {
    auto endpoint = parse_endpoint("192.168.1.20:47001");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->first, "192.168.1.20");
    EXPECT_EQ(endpoint->second, 47001);

    EXPECT_FALSE(parse_endpoint("").has_value());
    EXPECT_FALSE(parse_endpoint("localhost").has_value());
    EXPECT_FALSE(parse_endpoint(":80").has_value());
    EXPECT_FALSE(parse_endpoint("host:").has_value());
    EXPECT_FALSE(parse_endpoint("host:0").has_value());
    EXPECT_FALSE(parse_endpoint("host:70000").has_value());
    EXPECT_FALSE(parse_endpoint("host:8o").has_value());
}

TEST(TcpTransportTest, FramesCrossLocalhost) {
    boost::asio::io_context io;
    TcpTransport receiver_transport(io, loopback_options());
    TcpTransport sender_transport(io, loopback_options());

    Endpoint receiver;
    Endpoint sender;
    receiver_transport.open(Role::Receiver, std::nullopt, receiver.transport_handlers());
    ASSERT_TRUE(run_until(io, [&] { return receiver.id.has_value() || receiver.error.has_value(); }));
    ASSERT_TRUE(receiver.id.has_value()) << receiver.error->message;
    EXPECT_NE(receiver_transport.bound_port(), 0);
    EXPECT_EQ(*receiver.id, "127.0.0.1:" + std::to_string(receiver_transport.bound_port()));

    sender_transport.open(Role::Sender, *receiver.id, sender.transport_handlers());
    ASSERT_TRUE(run_until(io, [&] { return sender.channel && receiver.channel; }));

    const std::vector<std::uint8_t> hello{'h', 'e', 'l', 'l', 'o'};
    const std::vector<std::uint8_t> empty;
    ASSERT_TRUE(sender.channel->send(hello).is_ok());
    ASSERT_TRUE(sender.channel->send(empty).is_ok());
    ASSERT_TRUE(run_until(io, [&] { return receiver.received.size() == 2; }));
    EXPECT_EQ(receiver.received[0], hello);
    EXPECT_TRUE(receiver.received[1].empty());

    // Queued frames still reach the peer when the sender closes right away
    ASSERT_TRUE(receiver.channel->send(hello).is_ok());
    receiver.channel->close();
    ASSERT_TRUE(run_until(io, [&] { return sender.closed; }));
    ASSERT_EQ(sender.received.size(), 1u);
    EXPECT_EQ(sender.received[0], hello);
}

TEST(TcpTransportTest, OversizedFrameIsRefused) {
    boost::asio::io_context io;
    TcpTransport receiver_transport(io, loopback_options(16));
    TcpTransport sender_transport(io, loopback_options(16));

    Endpoint receiver;
    Endpoint sender;
    receiver_transport.open(Role::Receiver, std::nullopt, receiver.transport_handlers());
    ASSERT_TRUE(run_until(io, [&] { return receiver.id.has_value(); }));
    sender_transport.open(Role::Sender, *receiver.id, sender.transport_handlers());
    ASSERT_TRUE(run_until(io, [&] { return sender.channel && receiver.channel; }));

    auto result = sender.channel->send(std::vector<std::uint8_t>(17, 'x'));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Transport);
    EXPECT_TRUE(sender.channel->is_open());
}

TEST(TcpTransportTest, MalformedSessionIdFails) {
    boost::asio::io_context io;
    TcpTransport transport(io, loopback_options());

    Endpoint sender;
    transport.open(Role::Sender, std::string("not-an-endpoint"), sender.transport_handlers());
    io.run();

    ASSERT_TRUE(sender.error.has_value());
    EXPECT_EQ(sender.error->code, ErrorCode::Transport);
    EXPECT_FALSE(sender.channel);
}
