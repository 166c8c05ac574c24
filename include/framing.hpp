/*
 * PeerChat - frame codec
 *
 * Wire unit: [4-byte big-endian payload length][payload]. A zero-length frame
 * is legal. Frames longer than the configured maximum are a decode error.
 */

#pragma once

#include "transport.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace peerchat {

constexpr std::size_t kFrameHeaderSize = 4;
constexpr std::size_t kDefaultMaxFrameBytes = 131072;

std::vector<uint8_t> encode_frame(const std::vector<uint8_t>& payload);

// Incremental decoder over bytes arriving in arbitrary chunks.
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

    // Throws DecodeError as soon as a header announces an oversized frame.
    void feed(const uint8_t* data, std::size_t len);

    void feed(const std::vector<uint8_t>& data) { feed(data.data(), data.size()); }

    std::optional<std::vector<uint8_t>> next_frame();

    // Bytes held back waiting for the rest of a frame.
    std::size_t buffered() const { return buffer_.size(); }

    std::size_t max_frame_bytes() const { return max_frame_bytes_; }

private:
    uint32_t check_header() const;

    std::size_t max_frame_bytes_;
    std::deque<uint8_t> buffer_;
    std::deque<std::vector<uint8_t>> ready_;
};

// Pulls frames off a ByteStream, one payload per call. Not restartable: once
// it has returned nullopt or thrown, later calls return nullopt.
class FrameReader {
public:
    FrameReader(ByteStream& stream, std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

    // nullopt on a clean end of stream. Throws DecodeError on corruption,
    // including a stream that ends in the middle of a frame.
    std::optional<std::vector<uint8_t>> next();

private:
    ByteStream& stream_;
    FrameDecoder decoder_;
    bool finished_ = false;
};

bool write_frame(ByteStream& stream, const std::vector<uint8_t>& payload);

} // namespace peerchat
