#include "lexsync/network/tcp_transport.hpp"

#include <spdlog/spdlog.h>

namespace lexsync::network {

// ──────────────────────────────────────────────────────────
// TcpChannel
// ──────────────────────────────────────────────────────────

TcpChannel::TcpChannel(tcp::socket socket, std::size_t max_message_bytes)
    : socket_(std::move(socket))
    , max_message_bytes_(max_message_bytes) {
    boost::system::error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);
}

std::vector<std::uint8_t> TcpChannel::encode_header(std::size_t length) {
    return {
        static_cast<std::uint8_t>((length >> 24) & 0xFF),
        static_cast<std::uint8_t>((length >> 16) & 0xFF),
        static_cast<std::uint8_t>((length >> 8) & 0xFF),
        static_cast<std::uint8_t>(length & 0xFF),
    };
}

std::size_t TcpChannel::decode_header(const std::array<std::uint8_t, 4>& header) {
    return (static_cast<std::size_t>(header[0]) << 24) |
           (static_cast<std::size_t>(header[1]) << 16) |
           (static_cast<std::size_t>(header[2]) << 8) |
           static_cast<std::size_t>(header[3]);
}

void TcpChannel::start(ChannelHandlers handlers) {
    handlers_ = std::move(handlers);
    asio::post(socket_.get_executor(), [self = shared_from_this()] {
        if (!self->open_) {
            return;
        }
        if (self->handlers_.on_open) {
            self->handlers_.on_open();
        }
        self->do_read_header();
    });
}

Result<void> TcpChannel::send(std::vector<std::uint8_t> frame) {
    if (!open_) {
        return Err<void>(ErrorCode::Transport, "Channel is closed");
    }
    if (frame.size() > max_message_bytes_ || frame.size() > 0xFFFFFFFFu) {
        return Err<void>(ErrorCode::Transport,
                         "Frame of " + std::to_string(frame.size()) + " bytes exceeds limit");
    }

    auto header = encode_header(frame.size());
    frame.insert(frame.begin(), header.begin(), header.end());

    const bool idle = write_queue_.empty();
    write_queue_.push_back(std::move(frame));
    if (idle) {
        do_write();
    }
    return Ok();
}

void TcpChannel::close() {
    if (!open_) {
        return;
    }
    open_ = false;
    // Frames already queued still go out; the socket closes once they have
    if (write_queue_.empty()) {
        close_socket();
    } else {
        closing_ = true;
    }
}

void TcpChannel::close_socket() {
    closing_ = false;
    write_queue_.clear();
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void TcpChannel::do_read_header() {
    auto self = shared_from_this();
    asio::async_read(
        socket_,
        asio::buffer(header_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                fail(ec);
                return;
            }
            if (!open_) {
                return;
            }
            const std::size_t length = decode_header(header_);
            if (length > max_message_bytes_) {
                fail(Error(ErrorCode::Transport,
                           "Incoming frame of " + std::to_string(length) + " bytes exceeds limit"));
                return;
            }
            do_read_body(length);
        });
}

void TcpChannel::do_read_body(std::size_t length) {
    body_.assign(length, 0);
    auto self = shared_from_this();
    asio::async_read(
        socket_,
        asio::buffer(body_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                fail(ec);
                return;
            }
            if (!open_) {
                return;
            }
            if (handlers_.on_data) {
                handlers_.on_data(std::move(body_));
            }
            body_.clear();
            if (open_) {
                do_read_header();
            }
        });
}

void TcpChannel::do_write() {
    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(write_queue_.front()),
        [this, self](boost::system::error_code ec, std::size_t bytes_transferred) {
            if (ec) {
                if (closing_) {
                    close_socket();
                    return;
                }
                fail(ec);
                return;
            }
            spdlog::trace("Sent frame of {} bytes", bytes_transferred);
            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                do_write();
            } else if (closing_) {
                close_socket();
            }
        });
}

void TcpChannel::fail(const boost::system::error_code& ec) {
    if (!open_ || ec == asio::error::operation_aborted) {
        return;
    }
    if (ec == asio::error::eof || ec == asio::error::connection_reset) {
        close();
        if (handlers_.on_close) {
            handlers_.on_close();
        }
        return;
    }
    fail(Error(ErrorCode::Transport, "Socket error: " + ec.message()));
}

void TcpChannel::fail(Error error) {
    if (!open_) {
        return;
    }
    spdlog::debug("TCP channel failed: {}", error.message);
    close();
    if (handlers_.on_error) {
        handlers_.on_error(error);
    }
}

// ──────────────────────────────────────────────────────────
// TcpTransport
// ──────────────────────────────────────────────────────────

std::optional<std::pair<std::string, std::uint16_t>> parse_endpoint(const std::string& text) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }
    const std::string host = text.substr(0, colon);
    const std::string port_text = text.substr(colon + 1);

    unsigned long port = 0;
    for (char c : port_text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        port = port * 10 + static_cast<unsigned long>(c - '0');
        if (port > 65535) {
            return std::nullopt;
        }
    }
    if (port == 0) {
        return std::nullopt;
    }
    return std::make_pair(host, static_cast<std::uint16_t>(port));
}

TcpTransport::TcpTransport(asio::io_context& io_context, TcpTransportOptions options)
    : io_context_(io_context)
    , options_(std::move(options))
    , acceptor_(io_context)
    , resolver_(io_context) {}

void TcpTransport::open(Role role, std::optional<std::string> remote_id, TransportHandlers handlers) {
    shutdown();
    alive_ = std::make_shared<bool>(true);

    if (role == Role::Receiver) {
        listen(std::move(handlers));
        return;
    }

    if (!remote_id || remote_id->empty()) {
        asio::post(io_context_, [on_error = std::move(handlers.on_error)] {
            on_error(Error(ErrorCode::Transport, "Sender needs a session id to dial"));
        });
        return;
    }
    dial(*remote_id, std::move(handlers));
}

void TcpTransport::listen(TransportHandlers handlers) {
    boost::system::error_code ec;
    const auto address = asio::ip::make_address(options_.listen_address, ec);
    if (ec) {
        asio::post(io_context_, [on_error = handlers.on_error, address = options_.listen_address] {
            on_error(Error(ErrorCode::Transport, "Invalid listen address: " + address));
        });
        return;
    }

    const tcp::endpoint endpoint(address, options_.listen_port);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(1, ec);
    if (ec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        asio::post(io_context_, [on_error = handlers.on_error, message = ec.message()] {
            on_error(Error(ErrorCode::Transport, "Failed to listen: " + message));
        });
        return;
    }

    bound_port_ = acceptor_.local_endpoint().port();
    const std::string session_id = options_.advertise_host + ":" + std::to_string(bound_port_);
    spdlog::info("Listening for a peer on {}", session_id);

    std::weak_ptr<bool> token = alive_;
    asio::post(io_context_, [token, on_ready = handlers.on_ready, session_id] {
        auto live = token.lock();
        if (live && *live) {
            on_ready(session_id);
        }
    });

    acceptor_.async_accept(
        [this, token, handlers = std::move(handlers)](boost::system::error_code accept_ec, tcp::socket socket) {
            auto live = token.lock();
            if (!live || !*live) {
                return;
            }
            boost::system::error_code ignored;
            acceptor_.close(ignored);
            if (accept_ec) {
                handlers.on_error(Error(ErrorCode::Transport, "Accept failed: " + accept_ec.message()));
                return;
            }
            spdlog::debug("Accepted peer from {}", socket.remote_endpoint(ignored).address().to_string());
            handlers.on_channel(std::make_shared<TcpChannel>(std::move(socket), options_.max_message_bytes));
        });
}

void TcpTransport::dial(const std::string& remote_id, TransportHandlers handlers) {
    const auto endpoint = parse_endpoint(remote_id);
    if (!endpoint) {
        asio::post(io_context_, [on_error = std::move(handlers.on_error), remote_id] {
            on_error(Error(ErrorCode::Transport, "Malformed session id: " + remote_id));
        });
        return;
    }

    std::weak_ptr<bool> token = alive_;
    auto socket = std::make_shared<tcp::socket>(io_context_);
    dial_socket_ = socket;

    resolver_.async_resolve(
        endpoint->first, std::to_string(endpoint->second),
        [this, token, socket, handlers = std::move(handlers)](
            boost::system::error_code ec, tcp::resolver::results_type results) {
            auto live = token.lock();
            if (!live || !*live) {
                return;
            }
            if (ec) {
                handlers.on_error(Error(ErrorCode::Transport, "Resolve failed: " + ec.message()));
                return;
            }
            asio::async_connect(
                *socket, results,
                [this, token, socket, handlers](boost::system::error_code connect_ec, const tcp::endpoint&) {
                    auto still_live = token.lock();
                    if (!still_live || !*still_live) {
                        return;
                    }
                    dial_socket_.reset();
                    if (connect_ec) {
                        handlers.on_error(Error(ErrorCode::Transport, "Connect failed: " + connect_ec.message()));
                        return;
                    }
                    boost::system::error_code local_ec;
                    const auto local = socket->local_endpoint(local_ec);
                    handlers.on_ready(local.address().to_string() + ":" + std::to_string(local.port()));
                    handlers.on_channel(std::make_shared<TcpChannel>(std::move(*socket), options_.max_message_bytes));
                });
        });
}

void TcpTransport::shutdown() {
    if (alive_) {
        *alive_ = false;
    }
    boost::system::error_code ec;
    acceptor_.close(ec);
    resolver_.cancel();
    if (dial_socket_) {
        dial_socket_->close(ec);
        dial_socket_.reset();
    }
    bound_port_ = 0;
}

} // namespace lexsync::network
