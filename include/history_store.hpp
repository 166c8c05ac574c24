/*
 * PeerChat - message history
 */

#pragma once

#include "envelope.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace peerchat {

constexpr std::size_t kDefaultHistoryLimit = 1000;
constexpr std::size_t kDefaultHistoryPage = 100;

// Write side of persistence as seen by the chat protocol. Called from many
// threads at once.
class MessageStore {
public:
    virtual ~MessageStore() = default;

    virtual void append_message(const std::string& room_id, const ChatMessage& message) = 0;
};

struct StoredMessage {
    ChatMessage message;
    uint64_t stored_at_millis = 0;
};

class HistoryStore : public MessageStore {
public:
    // With a non-empty `log_dir`, every message is also appended as a JSON
    // line to <log_dir>/room_<room_id>.log.
    explicit HistoryStore(std::size_t max_per_room = kDefaultHistoryLimit, std::string log_dir = {});

    void append_message(const std::string& room_id, const ChatMessage& message) override;

    // The newest `limit` messages of the room, oldest first. 0 means all.
    std::vector<StoredMessage> history(const std::string& room_id, std::size_t limit = kDefaultHistoryPage) const;

    void clear_history(const std::string& room_id);

    std::vector<std::string> room_ids() const;

    std::size_t max_per_room() const { return max_per_room_; }

private:
    void append_to_log(const std::string& room_id, const StoredMessage& entry);

    std::size_t max_per_room_;
    std::string log_dir_;

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<StoredMessage>> rooms_;
};

} // namespace peerchat
