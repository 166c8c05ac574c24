/*
 * PeerChat - terminal front end
 */

#pragma once

#include "chat_protocol.hpp"
#include "config.hpp"
#include "events.hpp"
#include "history_store.hpp"

#include <functional>
#include <istream>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace peerchat {

class ChatConsole : public EventSink {
public:
    // Called by /connect so the transport learns where a peer lives.
    using AddressBookHook = std::function<void(const PeerAddress&)>;

    ChatConsole(HistoryStore& history, std::string nickname, std::ostream& out, AddressBookHook add_address);

    // The protocol is created with this console as its sink, so it is
    // attached afterwards. Commands that need it fail until then.
    void attach(ChatProtocol& protocol) { protocol_ = &protocol; }

    // Reads commands until /quit or end of input.
    void run(std::istream& in);

    // Handles one input line. Returns false once the user asked to quit.
    bool process_line(const std::string& line);

    std::string nickname() const;

    // Empty while plain text goes to the public room.
    std::string dm_target() const;

    void on_connected(const PeerId& peer) override;
    void on_disconnected(const PeerId& peer) override;
    void on_message_received(const ChatMessage& message) override;
    void on_handshake_received(const PeerId& peer, const Capabilities& capabilities) override;
    void on_nickname_changed(const PeerId& peer, const std::string& nickname) override;
    void on_typing_changed(const PeerId& peer, bool typing) override;
    void on_unknown_envelope(const PeerId& peer, const std::string& type) override;

private:
    void print_help();
    void show_prompt();
    void print(const std::string& line);
    std::string display_name(const PeerId& peer) const;
    std::string room_label(const std::string& room_id) const;
    std::string current_room() const;

    void cmd_connect(const std::vector<std::string>& args);
    void cmd_msg(const std::string& rest);
    void cmd_nick(const std::string& name);
    void cmd_typing(const std::vector<std::string>& args);
    void cmd_peers();
    void cmd_history(const std::vector<std::string>& args);
    void send_text(const std::string& text);

    HistoryStore& history_;
    ChatProtocol* protocol_ = nullptr;
    std::string nickname_;
    std::ostream& out_;
    AddressBookHook add_address_;

    std::mutex io_mutex_;

    // Guards nickname_, peer_names_ and dm_target_.
    mutable std::mutex peer_mutex_;
    std::map<PeerId, std::string> peer_names_;
    PeerId dm_target_;
};

} // namespace peerchat
