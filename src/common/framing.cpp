/*
 * PeerChat - frame codec implementation
 */

#include "framing.hpp"

#include "errors.hpp"

#include <arpa/inet.h>

#include <cstring>
#include <limits>
#include <string>

namespace peerchat {

std::vector<uint8_t> encode_frame(const std::vector<uint8_t>& payload) {
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("encode_frame: payload too large");
    }
    std::vector<uint8_t> frame(kFrameHeaderSize + payload.size());
    uint32_t len = htonl(static_cast<uint32_t>(payload.size()));
    std::memcpy(frame.data(), &len, sizeof(uint32_t));
    if (!payload.empty()) {
        std::memcpy(frame.data() + kFrameHeaderSize, payload.data(), payload.size());
    }
    return frame;
}

FrameDecoder::FrameDecoder(std::size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

void FrameDecoder::feed(const uint8_t* data, std::size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);

    while (buffer_.size() >= kFrameHeaderSize) {
        uint32_t frame_len = check_header();
        if (buffer_.size() < kFrameHeaderSize + frame_len) {
            break;
        }
        auto payload_begin = buffer_.begin() + kFrameHeaderSize;
        auto payload_end = payload_begin + frame_len;
        ready_.emplace_back(payload_begin, payload_end);
        buffer_.erase(buffer_.begin(), payload_end);
    }
}

uint32_t FrameDecoder::check_header() const {
    uint32_t frame_len = static_cast<uint32_t>(buffer_[0]) << 24 |
                         static_cast<uint32_t>(buffer_[1]) << 16 |
                         static_cast<uint32_t>(buffer_[2]) << 8 |
                         static_cast<uint32_t>(buffer_[3]);
    if (frame_len > max_frame_bytes_) {
        throw DecodeError("frame of " + std::to_string(frame_len) + " bytes exceeds limit of " +
                          std::to_string(max_frame_bytes_));
    }
    return frame_len;
}

std::optional<std::vector<uint8_t>> FrameDecoder::next_frame() {
    if (ready_.empty()) {
        return std::nullopt;
    }
    std::vector<uint8_t> payload = std::move(ready_.front());
    ready_.pop_front();
    return payload;
}

FrameReader::FrameReader(ByteStream& stream, std::size_t max_frame_bytes)
    : stream_(stream), decoder_(max_frame_bytes) {}

std::optional<std::vector<uint8_t>> FrameReader::next() {
    if (finished_) {
        return std::nullopt;
    }
    while (true) {
        auto payload = decoder_.next_frame();
        if (payload.has_value()) {
            return payload;
        }

        auto chunk = stream_.read();
        if (!chunk.has_value()) {
            finished_ = true;
            if (decoder_.buffered() > 0) {
                throw DecodeError("stream ended inside a frame (" + std::to_string(decoder_.buffered()) +
                                  " bytes pending)");
            }
            return std::nullopt;
        }
        try {
            decoder_.feed(chunk.value());
        } catch (const DecodeError&) {
            finished_ = true;
            throw;
        }
    }
}

bool write_frame(ByteStream& stream, const std::vector<uint8_t>& payload) {
    return stream.write(encode_frame(payload));
}

} // namespace peerchat
