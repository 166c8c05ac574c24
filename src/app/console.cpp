/*
 * PeerChat - terminal front end implementation
 */

#include "console.hpp"

#include "errors.hpp"
#include "room_id.hpp"
#include "utils.hpp"

#include <iostream>
#include <stdexcept>

namespace peerchat {

namespace {
std::vector<std::string> words(const std::string& text) {
    std::vector<std::string> out;
    for (auto& part : split(text, ' ')) {
        if (!part.empty()) {
            out.push_back(part);
        }
    }
    return out;
}

// Text after the first `count` words of `line`.
std::string rest_after(const std::string& line, std::size_t count) {
    std::size_t pos = 0;
    for (std::size_t i = 0; i < count; ++i) {
        pos = line.find_first_not_of(' ', pos);
        if (pos == std::string::npos) {
            return {};
        }
        pos = line.find(' ', pos);
        if (pos == std::string::npos) {
            return {};
        }
    }
    return trim(line.substr(pos));
}
} // namespace

ChatConsole::ChatConsole(HistoryStore& history, std::string nickname, std::ostream& out, AddressBookHook add_address)
    : history_(history), nickname_(std::move(nickname)), out_(out), add_address_(std::move(add_address)) {}

void ChatConsole::run(std::istream& in) {
    show_prompt();
    std::string line;
    while (std::getline(in, line)) {
        if (!process_line(line)) {
            break;
        }
        show_prompt();
    }
}

std::string ChatConsole::nickname() const {
    std::lock_guard<std::mutex> lock(peer_mutex_);
    return nickname_;
}

std::string ChatConsole::dm_target() const {
    std::lock_guard<std::mutex> lock(peer_mutex_);
    return dm_target_;
}

bool ChatConsole::process_line(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return true;
    }
    if (trimmed == "/quit") {
        return false;
    }
    if (trimmed == "/help") {
        print_help();
        return true;
    }
    if (!protocol_) {
        print("[error] not ready yet");
        return true;
    }

    auto args = words(trimmed);
    const std::string& command = args.front();
    try {
        if (command == "/connect") {
            cmd_connect(args);
        } else if (command == "/dm") {
            if (args.size() < 2) {
                print("Usage: /dm <peer>");
                return true;
            }
            {
                std::lock_guard<std::mutex> lock(peer_mutex_);
                dm_target_ = args[1];
            }
            print("Now talking to " + display_name(args[1]));
        } else if (command == "/public") {
            {
                std::lock_guard<std::mutex> lock(peer_mutex_);
                dm_target_.clear();
            }
            print("Now talking in the public room");
        } else if (command == "/msg") {
            cmd_msg(trimmed);
        } else if (command == "/nick") {
            cmd_nick(rest_after(trimmed, 1));
        } else if (command == "/typing") {
            cmd_typing(args);
        } else if (command == "/peers") {
            cmd_peers();
        } else if (command == "/history") {
            cmd_history(args);
        } else if (command == "/close") {
            if (args.size() < 2) {
                print("Usage: /close <peer>");
                return true;
            }
            protocol_->close_session(args[1]);
        } else if (command.front() == '/') {
            print("Unknown command " + command + ", try /help");
        } else {
            send_text(trimmed);
        }
    } catch (const ProtocolError& ex) {
        print(std::string("[error] ") + ex.what());
    } catch (const std::invalid_argument& ex) {
        print(std::string("[error] ") + ex.what());
    }
    return true;
}

void ChatConsole::cmd_connect(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        print("Usage: /connect <peer> <host:port>");
        return;
    }
    auto [host, port] = parse_host_port(args[2]);
    if (add_address_) {
        add_address_(PeerAddress{args[1], host, port});
    }
    protocol_->open_session(args[1]);
}

void ChatConsole::cmd_msg(const std::string& line) {
    auto args = words(line);
    std::string text = rest_after(line, 2);
    if (args.size() < 3 || text.empty()) {
        print("Usage: /msg <peer> <text>");
        return;
    }
    protocol_->send_message(args[1], text);
}

void ChatConsole::cmd_nick(const std::string& name) {
    if (name.empty()) {
        print("Usage: /nick <name>");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(peer_mutex_);
        nickname_ = name;
    }
    auto failures = protocol_->broadcast_nickname(name);
    print("You are now known as " + name);
    for (const auto& failure : failures) {
        print("[warn] " + display_name(failure.peer) + " did not get the update: " + failure.reason);
    }
}

void ChatConsole::cmd_typing(const std::vector<std::string>& args) {
    if (args.size() < 3 || (args[2] != "on" && args[2] != "off")) {
        print("Usage: /typing <peer> on|off");
        return;
    }
    protocol_->send_typing(args[1], args[2] == "on");
}

void ChatConsole::cmd_peers() {
    auto peers = protocol_->active_peers();
    if (peers.empty()) {
        print("No connected peers");
        return;
    }
    std::string listing = "Connected peers:";
    for (const auto& peer : peers) {
        listing += "\n  " + peer;
        std::string name = display_name(peer);
        if (name != peer) {
            listing += " (" + name + ")";
        }
    }
    print(listing);
}

void ChatConsole::cmd_history(const std::vector<std::string>& args) {
    std::size_t limit = kDefaultHistoryPage;
    if (args.size() >= 2) {
        try {
            limit = static_cast<std::size_t>(std::stoul(args[1]));
        } catch (const std::exception&) {
            print("Usage: /history [n]");
            return;
        }
    }
    std::string room = current_room();
    auto entries = history_.history(room, limit);
    if (entries.empty()) {
        print("No history for " + room_label(room));
        return;
    }
    std::string listing = "History for " + room_label(room) + ":";
    for (const auto& entry : entries) {
        listing += "\n  " + display_name(entry.message.sender) + ": " + entry.message.body;
    }
    print(listing);
}

void ChatConsole::send_text(const std::string& text) {
    PeerId target = dm_target();
    if (!target.empty()) {
        protocol_->send_message(target, text);
        return;
    }
    auto result = protocol_->broadcast(text, protocol_->config().public_room_id);
    if (result.sent.empty() && result.failures.empty()) {
        print("[info] nobody is connected; use /connect <peer> <host:port>");
    }
    for (const auto& failure : result.failures) {
        print("[warn] not delivered to " + display_name(failure.peer) + ": " + failure.reason);
    }
}

std::string ChatConsole::current_room() const {
    PeerId target = dm_target();
    if (target.empty()) {
        return protocol_->config().public_room_id;
    }
    return derive_room_id(protocol_->config().self_peer, target);
}

std::string ChatConsole::room_label(const std::string& room_id) const {
    if (protocol_ && room_id == protocol_->config().public_room_id) {
        return "public";
    }
    return "dm " + room_id;
}

std::string ChatConsole::display_name(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(peer_mutex_);
    if (protocol_ && peer == protocol_->config().self_peer) {
        return nickname_;
    }
    auto it = peer_names_.find(peer);
    return it != peer_names_.end() ? it->second : peer;
}

void ChatConsole::on_connected(const PeerId& peer) {
    print("[peer] connected to " + peer);
}

void ChatConsole::on_disconnected(const PeerId& peer) {
    print("[peer] " + display_name(peer) + " disconnected");
}

void ChatConsole::on_message_received(const ChatMessage& message) {
    print("[" + room_label(message.room_id) + "] " + display_name(message.sender) + ": " + message.body);
}

void ChatConsole::on_handshake_received(const PeerId& peer, const Capabilities& capabilities) {
    log_debug("Handshake with " + peer + " (v" + std::to_string(capabilities.version) + ")");
}

void ChatConsole::on_nickname_changed(const PeerId& peer, const std::string& nickname) {
    std::string previous = display_name(peer);
    {
        std::lock_guard<std::mutex> lock(peer_mutex_);
        peer_names_[peer] = nickname;
    }
    print("[peer] " + previous + " is now known as " + nickname);
}

void ChatConsole::on_typing_changed(const PeerId& peer, bool typing) {
    if (typing) {
        print("[peer] " + display_name(peer) + " is typing...");
    }
}

void ChatConsole::on_unknown_envelope(const PeerId& peer, const std::string& type) {
    log_debug("Ignored " + type + " from " + peer);
}

void ChatConsole::print_help() {
    print("Commands:\n"
          "  /connect <peer> <host:port> - open a session\n"
          "  /dm <peer>                  - send plain text to one peer\n"
          "  /public                     - send plain text to everyone\n"
          "  /msg <peer> <text>          - one direct message\n"
          "  /nick <name>                - change nickname\n"
          "  /typing <peer> on|off       - typing indicator\n"
          "  /peers                      - list connected peers\n"
          "  /history [n]                - recent messages of the current room\n"
          "  /close <peer>               - close a session\n"
          "  /quit                       - exit\n"
          "  <text>                      - send to the current room");
}

void ChatConsole::show_prompt() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    out_ << "> " << std::flush;
}

void ChatConsole::print(const std::string& line) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    out_ << "\n" << line << std::endl;
}

} // namespace peerchat
