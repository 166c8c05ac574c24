/*
 * PeerChat - message history implementation
 */

#include "history_store.hpp"

#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace peerchat {

namespace {
std::string room_log_name(const std::string& room_id) {
    std::string name = "room_";
    for (unsigned char ch : room_id) {
        name += (std::isalnum(ch) || ch == '-' || ch == '.') ? static_cast<char>(ch) : '_';
    }
    return name + ".log";
}
} // namespace

HistoryStore::HistoryStore(std::size_t max_per_room, std::string log_dir)
    : max_per_room_(max_per_room), log_dir_(std::move(log_dir)) {
    if (max_per_room_ == 0) {
        throw std::invalid_argument("HistoryStore: max_per_room must be positive");
    }
}

void HistoryStore::append_message(const std::string& room_id, const ChatMessage& message) {
    StoredMessage entry{message, wall_clock_millis()};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& room = rooms_[room_id];
        room.push_back(entry);
        while (room.size() > max_per_room_) {
            room.pop_front();
        }
    }

    if (!log_dir_.empty()) {
        append_to_log(room_id, entry);
    }
}

std::vector<StoredMessage> HistoryStore::history(const std::string& room_id, std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return {};
    }
    const auto& room = it->second;
    std::size_t skip = (limit != 0 && room.size() > limit) ? room.size() - limit : 0;
    return std::vector<StoredMessage>(room.begin() + static_cast<std::ptrdiff_t>(skip), room.end());
}

void HistoryStore::clear_history(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    rooms_.erase(room_id);
}

std::vector<std::string> HistoryStore::room_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(rooms_.size());
    for (const auto& [id, room] : rooms_) {
        ids.push_back(id);
    }
    return ids;
}

void HistoryStore::append_to_log(const std::string& room_id, const StoredMessage& entry) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        log_warn("Failed to create history directory " + log_dir_ + ": " + ec.message());
        return;
    }

    auto payload = serialize_envelope(entry.message);
    auto line = nlohmann::json::parse(payload.begin(), payload.end());
    line["stored_at"] = entry.stored_at_millis;

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(std::filesystem::path(log_dir_) / room_log_name(room_id), std::ios::app);
    if (!out) {
        log_warn("Unable to write history log for room " + room_id);
        return;
    }
    out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

} // namespace peerchat
