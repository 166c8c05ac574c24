/*
 * PeerChat entry point
 */

#include "chat_protocol.hpp"
#include "config.hpp"
#include "console.hpp"
#include "history_store.hpp"
#include "tcp_transport.hpp"
#include "utils.hpp"

#include <iostream>
#include <memory>
#include <optional>

using namespace peerchat;

namespace {

void print_usage() {
    std::cerr << "Usage: peerchat [--config <path>] [--peer-id <id>] [--listen <host:port>]\n"
                 "                [--nick <name>] [--log-level debug|info|warn|error]\n"
                 "                [--log-file <path>] [--history-dir <dir>]\n";
}

// Applies command-line overrides on top of `config`. Returns false on a
// malformed command line.
bool apply_arguments(int argc, char** argv, NodeConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }
        std::string value = argv[++i];
        if (arg == "--config") {
            // Loaded before the other overrides.
        } else if (arg == "--peer-id") {
            config.protocol.self_peer = value;
        } else if (arg == "--listen") {
            auto [host, port] = parse_host_port(value);
            config.listen_host = host;
            config.listen_port = port;
        } else if (arg == "--nick") {
            config.nickname = value;
        } else if (arg == "--log-level") {
            auto level = parse_log_level(value);
            if (!level.has_value()) {
                std::cerr << "Unknown log level " << value << "\n";
                return false;
            }
            config.log_level = level.value();
        } else if (arg == "--log-file") {
            config.log_file = value;
        } else if (arg == "--history-dir") {
            config.history_dir = value;
        } else {
            std::cerr << "Unknown option " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::optional<std::string> config_path(int argc, char** argv) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv) {
    NodeConfig config;
    try {
        if (auto path = config_path(argc, argv)) {
            config = load_node_config(*path);
        }
        if (!apply_arguments(argc, argv, config)) {
            print_usage();
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    set_log_level(config.log_level);

    std::unique_ptr<FileLogger> file_logger;
    if (!config.log_file.empty()) {
        file_logger = std::make_unique<FileLogger>(config.log_file);
        attach_file_logger(file_logger.get());
    }

    int exit_code = 0;
    try {
        if (config.protocol.self_peer.empty()) {
            config.protocol.self_peer = "peer-" + hex_encode(random_bytes(8));
            log_info("No peer id configured, generated " + config.protocol.self_peer);
        }

        TcpTransport transport(config.protocol.self_peer, config.listen_host, config.listen_port);
        for (const auto& address : config.peers) {
            transport.add_peer_address(address.peer, address.host, address.port);
        }
        transport.start();

        HistoryStore history(config.history_limit, config.history_dir);
        ChatConsole console(history, config.nickname, std::cout, [&transport](const PeerAddress& address) {
            transport.add_peer_address(address.peer, address.host, address.port);
        });

        {
            ChatProtocol protocol(transport, history, console, config.protocol);
            console.attach(protocol);
            protocol.start();

            std::cout << "PeerChat " << config.protocol.self_peer << " listening on "
                      << config.listen_host << ":" << transport.port() << std::endl;
            std::cout << "Type /help for commands.\n";
            console.run(std::cin);
        }

        transport.stop();
    } catch (const std::exception& ex) {
        log_error(std::string("Fatal: ") + ex.what());
        exit_code = 1;
    }

    attach_file_logger(nullptr);
    return exit_code;
}
