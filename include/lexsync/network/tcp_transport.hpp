#pragma once

#include "lexsync/network/channel.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>

namespace lexsync::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct TcpTransportOptions {
    std::string listen_address = "0.0.0.0";
    std::uint16_t listen_port = 0;
    std::string advertise_host = "127.0.0.1";
    std::size_t max_message_bytes = 64 * 1024 * 1024;
};

/**
 * @brief Length-delimited frames over one TCP socket
 *
 * Wire format per frame: 4-byte big-endian payload length, then payload.
 * A length above max_message_bytes is treated as a corrupt stream and the
 * channel fails with a transport error. close() lets already queued frames
 * drain before the socket goes away.
 *
 * Lifecycle (same shape as the HTTP connection objects):
 * 1. Created around a connected socket
 * 2. start() posts on_open and begins the read loop
 * 3. Each async step holds shared_from_this()
 */
class TcpChannel : public Channel, public std::enable_shared_from_this<TcpChannel> {
public:
    TcpChannel(tcp::socket socket, std::size_t max_message_bytes);

    void start(ChannelHandlers handlers) override;
    bool is_open() const override { return open_; }
    Result<void> send(std::vector<std::uint8_t> frame) override;
    void close() override;

    static std::vector<std::uint8_t> encode_header(std::size_t length);
    static std::size_t decode_header(const std::array<std::uint8_t, 4>& header);

private:
    void do_read_header();
    void do_read_body(std::size_t length);
    void do_write();
    void close_socket();
    void fail(const boost::system::error_code& ec);
    void fail(Error error);

    tcp::socket socket_;
    std::size_t max_message_bytes_;
    ChannelHandlers handlers_;
    std::array<std::uint8_t, 4> header_{};
    std::vector<std::uint8_t> body_;
    std::deque<std::vector<std::uint8_t>> write_queue_;
    bool open_ = true;
    bool closing_ = false;
};

/**
 * @brief Direct TCP bootstrap
 *
 * Receiver binds listen_address:listen_port, publishes
 * "<advertise_host>:<bound port>" as its session id and accepts exactly
 * one peer. Sender parses "host:port", resolves and connects.
 */
class TcpTransport : public Transport {
public:
    TcpTransport(asio::io_context& io_context, TcpTransportOptions options);
    ~TcpTransport() override { shutdown(); }

    void open(Role role, std::optional<std::string> remote_id, TransportHandlers handlers) override;
    void shutdown() override;

    /// Port the acceptor is bound to, 0 when not listening
    [[nodiscard]] std::uint16_t bound_port() const noexcept { return bound_port_; }

private:
    void listen(TransportHandlers handlers);
    void dial(const std::string& remote_id, TransportHandlers handlers);

    asio::io_context& io_context_;
    TcpTransportOptions options_;
    tcp::acceptor acceptor_;
    tcp::resolver resolver_;
    std::shared_ptr<tcp::socket> dial_socket_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
    std::uint16_t bound_port_ = 0;
};

/// Split "host:port"; nullopt when malformed
std::optional<std::pair<std::string, std::uint16_t>> parse_endpoint(const std::string& text);

} // namespace lexsync::network
