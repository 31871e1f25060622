#ifndef WOL_MAGIC_PACKET_H
#define WOL_MAGIC_PACKET_H

#include <array>
#include <cstddef>
#include <cstdint>

#include "wol/mac.h"
#include "wol/status.h"

namespace wol {

const size_t magic_header_size = 6;
const size_t magic_repeat = 16;
const size_t magic_packet_size = magic_header_size + mac_size * magic_repeat;

// 6 x 0xFF, then the target MAC 16 times.
typedef std::array<uint8_t, magic_packet_size> magic_packet;

magic_packet build_magic_packet(const mac_address& mac);

// For MAC bytes that did not come through parse_mac. Fails with
// invalid_mac_length unless exactly mac_size bytes are given; `out` is only
// written on success.
status build_magic_packet(const uint8_t* bytes, size_t len, magic_packet& out);

// Recovers the target MAC from a received payload.
status parse_magic_packet(const uint8_t* data, size_t len, mac_address& out);

}  // namespace wol

#endif  // WOL_MAGIC_PACKET_H
