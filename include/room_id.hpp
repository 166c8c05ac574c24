/*
 * PeerChat - conversation identifiers
 */

#pragma once

#include "transport.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace peerchat {

constexpr std::size_t kRoomIdLength = 16;

// MurmurHash3, x86 32-bit variant.
uint32_t murmur3_32(const uint8_t* data, std::size_t len, uint32_t seed);

// Stable id for the direct conversation between two peers: the pair is
// sorted, joined with ':' and hashed under two seeds. Symmetric in its
// arguments and always kRoomIdLength lowercase hex characters.
std::string derive_room_id(const PeerId& a, const PeerId& b);

} // namespace peerchat
