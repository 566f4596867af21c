#include "lexsync/app/peer_node.hpp"
#include "lexsync/core/config.hpp"
#include "lexsync/events/components.hpp"
#include "lexsync/events/events.hpp"
#include "lexsync/network/tcp_transport.hpp"
#include "lexsync/sync/last_sync_store.hpp"
#include "lexsync/sync/profile.hpp"
#include "lexsync/transfer/sender.hpp"
#include "lexsync/vocab/store.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;

using lexsync::Role;
using lexsync::session::ConnectionState;

namespace {

struct Options {
    Role role = Role::Receiver;
    std::optional<std::string> session_id;
    std::optional<fs::path> config_path;
    fs::path store_path = "vocabulary.json";
    fs::path state_path = "sync_state.json";
    fs::path output_dir = "received";
    lexsync::sync::SyncProfile profile{"default", "Default", "en", "es"};
    std::optional<std::uint16_t> port;
    std::vector<fs::path> files;
    std::optional<std::string> text;
    bool sync = false;
};

void print_usage(const char* program) {
    std::cout
        << "Usage:\n"
        << "  " << program << " receive [options]\n"
        << "  " << program << " send <sessionId> [options]\n\n"
        << "Options:\n"
        << "  -c, --config <file>    engine config (JSON)\n"
        << "  --store <file>         vocabulary store (default vocabulary.json)\n"
        << "  --state <file>         last sync state (default sync_state.json)\n"
        << "  --source <lang>        profile source language (default en)\n"
        << "  --target <lang>        profile target language (default es)\n"
        << "  --profile <id>         profile id\n"
        << "  -p, --port <n>         listen port for receive\n"
        << "  -o, --out <dir>        directory for received files (default received)\n"
        << "  -f, --file <path>      send a file after verification (repeatable)\n"
        << "  -t, --text <text>      send a text after verification\n"
        << "  -s, --sync             sync vocabularies after verification\n";
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    if (argc < 2) {
        return std::nullopt;
    }

    Options options;
    auto role = lexsync::parse_role(argv[1]);
    if (!role) {
        return std::nullopt;
    }
    options.role = *role;

    int i = 2;
    if (options.role == Role::Sender) {
        if (argc < 3) {
            return std::nullopt;
        }
        options.session_id = argv[2];
        i = 3;
    }

    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if ((arg == "-c" || arg == "--config") && has_value) {
            options.config_path = fs::path(argv[++i]);
        } else if (arg == "--store" && has_value) {
            options.store_path = fs::path(argv[++i]);
        } else if (arg == "--state" && has_value) {
            options.state_path = fs::path(argv[++i]);
        } else if (arg == "--source" && has_value) {
            options.profile.source_language = argv[++i];
        } else if (arg == "--target" && has_value) {
            options.profile.target_language = argv[++i];
        } else if (arg == "--profile" && has_value) {
            options.profile.profile_id = argv[++i];
            options.profile.profile_name = options.profile.profile_id;
        } else if ((arg == "-p" || arg == "--port") && has_value) {
            const int port = std::atoi(argv[++i]);
            if (port < 0 || port > 65535) {
                return std::nullopt;
            }
            options.port = static_cast<std::uint16_t>(port);
        } else if ((arg == "-o" || arg == "--out") && has_value) {
            options.output_dir = fs::path(argv[++i]);
        } else if ((arg == "-f" || arg == "--file") && has_value) {
            options.files.emplace_back(argv[++i]);
        } else if ((arg == "-t" || arg == "--text") && has_value) {
            options.text = argv[++i];
        } else if (arg == "-s" || arg == "--sync") {
            options.sync = true;
        } else {
            return std::nullopt;
        }
    }
    return options;
}

bool write_received(const fs::path& dir, const lexsync::transfer::ReceivedFile& file) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", dir.string(), ec.message());
        return false;
    }

    // Only the last path component; a peer must not pick where we write
    const fs::path target = dir / fs::path(file.name).filename();
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Cannot write {}", target.string());
        return false;
    }
    out.write(reinterpret_cast<const char*>(file.data.data()), static_cast<std::streamsize>(file.data.size()));
    spdlog::info("Saved {} ({} bytes)", target.string(), file.data.size());
    return true;
}

// Global io_context for signal handling
asio::io_context* g_io_context = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_io_context) {
            g_io_context->stop();
        }
    }
}

int run_peer(Options options) {
    lexsync::EngineConfig config;
    if (options.config_path) {
        auto loaded = lexsync::load_config(*options.config_path);
        if (loaded.is_error()) {
            spdlog::error("Config error: {}", loaded.error().message);
            return 1;
        }
        config = std::move(loaded.value());
    }
    if (options.port) {
        config.listen_port = *options.port;
    }
    lexsync::configure_logging(config);

    auto store = lexsync::vocab::JsonFileVocabularyStore::open(options.store_path);
    if (store.is_error()) {
        spdlog::error("Cannot open vocabulary store: {}", store.error().message);
        return 1;
    }

    std::vector<lexsync::transfer::OutgoingFile> outgoing;
    for (const auto& path : options.files) {
        auto file = lexsync::transfer::load_file(path);
        if (file.is_error()) {
            spdlog::error("{}", file.error().message);
            return 1;
        }
        outgoing.push_back(std::move(file.value()));
    }

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("lexsync peer - {}", lexsync::to_string(options.role));
    spdlog::info("════════════════════════════════════════════");

    asio::io_context io_context;
    lexsync::sync::JsonFileLastSyncStore last_sync(options.state_path);
    lexsync::sync::FixedProfileProvider profiles(options.profile);

    lexsync::network::TcpTransportOptions tcp_options;
    tcp_options.listen_address = config.listen_address;
    tcp_options.listen_port = config.listen_port;
    tcp_options.advertise_host = config.advertise_host;
    tcp_options.max_message_bytes = config.max_message_bytes;
    lexsync::network::TcpTransport transport(io_context, tcp_options);

    bool reached_connected = false;
    int exit_code = 0;

    // ────────────────────────────────────────────────────────
    // Sender actions once verified: sync, files, text, hang up
    // ────────────────────────────────────────────────────────

    lexsync::app::PeerNode* node_ptr = nullptr;

    auto finish_sender = [&] { node_ptr->disconnect(); };

    auto send_text = [&] {
        if (options.text) {
            auto sent = node_ptr->connection().send_text(*options.text);
            if (sent.is_error()) {
                spdlog::error("Text not sent: {}", sent.error().message);
                exit_code = 1;
            }
        }
        asio::post(io_context, finish_sender);
    };

    auto send_payloads = [&] {
        if (outgoing.empty()) {
            send_text();
            return;
        }
        node_ptr->connection().send_files(std::move(outgoing), [&](lexsync::Result<void> result) {
            if (result.is_error()) {
                spdlog::error("File transfer: {}", result.error().message);
                exit_code = 1;
            }
            send_text();
        });
    };

    lexsync::app::PeerNodeOptions node_options;
    node_options.auto_sync = options.sync && options.role == Role::Sender;
    node_options.on_auto_sync = [&](lexsync::Result<lexsync::sync::SyncStats> result) {
        if (result.is_ok()) {
            const auto& stats = result.value();
            spdlog::info("Sync finished: {} new from peer, {} updated, {} newer here",
                         stats.remote_added, stats.local_updated, stats.remote_updated);
        } else {
            exit_code = 1;
        }
        send_payloads();
    };

    lexsync::app::PeerNode node(io_context, transport, *store.value(), last_sync, profiles, config,
                                std::move(node_options));
    node_ptr = &node;
    lexsync::events::LoggerComponent logger(node.bus());

    g_io_context = &io_context;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::optional<asio::posix::stream_descriptor> input;

    std::vector<lexsync::events::Subscription> subscriptions;

    subscriptions.push_back(node.bus().subscribe<lexsync::events::VerificationCodeEvent>(
        [](const lexsync::events::VerificationCodeEvent& e) {
            if (e.role == Role::Sender) {
                std::cout << "\n  Verification code: " << e.code
                          << "\n  Enter it on the receiving device.\n" << std::endl;
            }
        }));

    subscriptions.push_back(node.bus().subscribe<lexsync::events::TextReceivedEvent>(
        [](const lexsync::events::TextReceivedEvent& e) {
            std::cout << "\n--- text (" << e.content_type.value_or("text") << ") ---\n"
                      << e.content << "\n---\n" << std::endl;
        }));

    subscriptions.push_back(node.bus().subscribe<lexsync::events::FileReceivedEvent>(
        [&](const lexsync::events::FileReceivedEvent& e) {
            if (!write_received(options.output_dir, e.file)) {
                exit_code = 1;
            }
        }));

    subscriptions.push_back(node.bus().subscribe<lexsync::events::ConnectionStateChangedEvent>(
        [&](const lexsync::events::ConnectionStateChangedEvent& e) {
            if (e.current == ConnectionState::Connected && e.previous == ConnectionState::Verifying) {
                reached_connected = true;
                if (options.role == Role::Sender && !options.sync) {
                    asio::post(io_context, send_payloads);
                }
            }
            if (e.current == ConnectionState::Disconnected) {
                if (e.error && !reached_connected) {
                    spdlog::error("Session ended: {}", *e.error);
                    exit_code = 1;
                } else {
                    spdlog::info("Session ended{}", e.error ? ": " + *e.error : std::string());
                }
                // run() returns once the last queued frames are flushed
                if (input) {
                    boost::system::error_code ignored;
                    input->cancel(ignored);
                }
            }
        }));

    // ────────────────────────────────────────────────────────
    // Receiver reads the code from stdin, one line per attempt
    // ────────────────────────────────────────────────────────

    std::string input_buffer;
    std::function<void()> read_code;
    read_code = [&] {
        asio::async_read_until(*input, asio::dynamic_buffer(input_buffer), '\n',
            [&](const boost::system::error_code& ec, std::size_t length) {
                if (ec) {
                    if (ec != asio::error::operation_aborted) {
                        spdlog::warn("stdin closed: {}", ec.message());
                    }
                    return;
                }
                std::string code = input_buffer.substr(0, length - 1);
                input_buffer.erase(0, length);
                if (!code.empty() && code.back() == '\r') {
                    code.pop_back();
                }
                if (!node.connection().is_verified() && !node.connection().submit_verification_code(code)) {
                    std::cout << "  " << node.connection().error().value_or("Invalid code") << std::endl;
                }
                read_code();
            });
    };

    auto on_connected = [&](lexsync::Result<std::string> result) {
        if (result.is_error()) {
            spdlog::error("Connect failed: {}", result.error().message);
            exit_code = 1;
            io_context.stop();
            return;
        }
        if (options.role == Role::Sender) {
            return;
        }

        std::cout << "\n  Session id: " << result.value()
                  << "\n  Run on the other device:  sync_peer send " << result.value()
                  << "\n  Then type the code it shows and press enter.\n" << std::endl;

        boost::system::error_code ec;
        input.emplace(io_context);
        input->assign(::dup(STDIN_FILENO), ec);
        if (ec) {
            spdlog::error("Cannot read verification code from stdin: {}", ec.message());
            node.disconnect();
            return;
        }
        read_code();
    };

    if (options.role == Role::Receiver) {
        node.listen(on_connected);
    } else {
        node.dial(*options.session_id, on_connected);
    }

    io_context.run();
    g_io_context = nullptr;
    node.disconnect();
    if (input) {
        boost::system::error_code ignored;
        input->close(ignored);
    }

    for (auto& subscription : subscriptions) {
        subscription.unsubscribe();
    }

    if (!reached_connected) {
        spdlog::warn("Session never reached the connected state");
        return 1;
    }
    return exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        return run_peer(std::move(*parsed));
    } catch (const std::exception& e) {
        spdlog::error("Peer error: {}", e.what());
        return 1;
    }
}
