/*
 * PeerChat - conversation identifiers implementation
 */

#include "room_id.hpp"

#include <cstdio>

namespace peerchat {

namespace {
constexpr uint32_t kRoomSeedLow = 0x00000000;
constexpr uint32_t kRoomSeedHigh = 0x9747b28c;

inline uint32_t rotl32(uint32_t x, int r) {
    return (x << r) | (x >> (32 - r));
}

inline uint32_t fmix32(uint32_t h) {
    h ^= h >> 16;
    h *= 0x85ebca6b;
    h ^= h >> 13;
    h *= 0xc2b2ae35;
    h ^= h >> 16;
    return h;
}
} // namespace

uint32_t murmur3_32(const uint8_t* data, std::size_t len, uint32_t seed) {
    constexpr uint32_t c1 = 0xcc9e2d51;
    constexpr uint32_t c2 = 0x1b873593;

    uint32_t h1 = seed;
    const std::size_t nblocks = len / 4;

    for (std::size_t i = 0; i < nblocks; ++i) {
        // Little-endian block read, independent of host byte order.
        const uint8_t* p = data + i * 4;
        uint32_t k1 = static_cast<uint32_t>(p[0]) | static_cast<uint32_t>(p[1]) << 8 |
                      static_cast<uint32_t>(p[2]) << 16 | static_cast<uint32_t>(p[3]) << 24;
        k1 *= c1;
        k1 = rotl32(k1, 15);
        k1 *= c2;

        h1 ^= k1;
        h1 = rotl32(h1, 13);
        h1 = h1 * 5 + 0xe6546b64;
    }

    const uint8_t* tail = data + nblocks * 4;
    uint32_t k1 = 0;
    switch (len & 3) {
        case 3:
            k1 ^= static_cast<uint32_t>(tail[2]) << 16;
            [[fallthrough]];
        case 2:
            k1 ^= static_cast<uint32_t>(tail[1]) << 8;
            [[fallthrough]];
        case 1:
            k1 ^= tail[0];
            k1 *= c1;
            k1 = rotl32(k1, 15);
            k1 *= c2;
            h1 ^= k1;
    }

    h1 ^= static_cast<uint32_t>(len);
    return fmix32(h1);
}

std::string derive_room_id(const PeerId& a, const PeerId& b) {
    const PeerId& first = a < b ? a : b;
    const PeerId& second = a < b ? b : a;
    std::string combined = first + ":" + second;

    const auto* bytes = reinterpret_cast<const uint8_t*>(combined.data());
    uint32_t low = murmur3_32(bytes, combined.size(), kRoomSeedLow);
    uint32_t high = murmur3_32(bytes, combined.size(), kRoomSeedHigh);

    char buffer[kRoomIdLength + 1];
    std::snprintf(buffer, sizeof(buffer), "%08x%08x", low, high);
    return std::string(buffer, kRoomIdLength);
}

} // namespace peerchat
